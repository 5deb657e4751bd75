#include "hubagent/hub/error.hpp"

namespace hubagent::hub {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPath: return "invalid path";
        case ErrorKind::Encoding:    return "encoding error";
        case ErrorKind::Connection:  return "connection error";
        case ErrorKind::Http:        return "http error";
        case ErrorKind::Decode:      return "decode error";
    }
    return "error";
}

Error Error::InvalidPath(const std::string& path) {
    return {.kind = ErrorKind::InvalidPath, .message = "path " + path + " must start with /"};
}

Error Error::Encoding(std::string message) {
    return {.kind = ErrorKind::Encoding, .message = std::move(message)};
}

Error Error::Connection(std::string message) {
    return {.kind = ErrorKind::Connection, .message = std::move(message)};
}

Error Error::Http(int status, std::string body) {
    Error err{.kind = ErrorKind::Http, .status = status, .body = std::move(body)};
    err.message = "unexpected API response: " + std::to_string(status) + " " + err.body;
    return err;
}

Error Error::Decode(std::string message) {
    return {.kind = ErrorKind::Decode, .message = std::move(message)};
}

bool Error::Retryable() const {
    switch (kind) {
        case ErrorKind::Connection:
            return true;
        case ErrorKind::Http:
            return status >= 500 || status == 429;
        default:
            return false;
    }
}

std::string Error::ToString() const {
    return std::string(hub::ToString(kind)) + ": " + message;
}

} // namespace hubagent::hub
