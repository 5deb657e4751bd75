#include "hubagent/update/update_error.hpp"

namespace hubagent {

const char* ToString(UpdateOutcome outcome) {
    switch (outcome) {
        case UpdateOutcome::Rejected: return "rejected";
        case UpdateOutcome::Failed:   return "failed";
    }
    return "unknown";
}

const char* ToString(UpdateErrorCode code) {
    switch (code) {
        case UpdateErrorCode::Connection:        return "connection";
        case UpdateErrorCode::Http:              return "http";
        case UpdateErrorCode::Io:                return "io";
        case UpdateErrorCode::Filesystem:        return "filesystem";
        case UpdateErrorCode::MissingMetadata:   return "missing-metadata";
        case UpdateErrorCode::DigestMismatch:    return "digest-mismatch";
        case UpdateErrorCode::SignatureDecode:   return "signature-decode";
        case UpdateErrorCode::SignatureMismatch: return "signature-mismatch";
    }
    return "unknown";
}

} // namespace hubagent
