#pragma once

#include <string>

namespace hubagent::hub {

enum class ErrorKind {
    InvalidPath, // path does not start with '/'
    Encoding,    // request body could not be serialized or compressed
    Connection,  // no HTTP response was obtained
    Http,        // response status >= 400
    Decode,      // response body is not the expected JSON
};

const char* ToString(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::Connection;
    std::string message;

    // Set for ErrorKind::Http only.
    int status = 0;
    std::string body;

    static Error InvalidPath(const std::string& path);
    static Error Encoding(std::string message);
    static Error Connection(std::string message);
    static Error Http(int status, std::string body);
    static Error Decode(std::string message);

    bool IsConnection() const { return kind == ErrorKind::Connection; }
    bool IsHttp() const { return kind == ErrorKind::Http; }

    // Connection failures and server-side statuses (5xx, 429) may succeed
    // later; everything else will fail the same way with the same input.
    bool Retryable() const;

    std::string ToString() const;
};

} // namespace hubagent::hub
