#pragma once

#include <string>

namespace hubagent {

enum class UpdateOutcome {
    Rejected, // the binary or its metadata failed an integrity/trust check
    Failed,   // network, I/O or filesystem trouble; a later attempt may succeed
};

enum class UpdateErrorCode {
    Connection,
    Http,
    Io,
    Filesystem,
    MissingMetadata,
    DigestMismatch,
    SignatureDecode,
    SignatureMismatch,
};

const char* ToString(UpdateOutcome outcome);
const char* ToString(UpdateErrorCode code);

struct UpdateError {
    UpdateOutcome outcome = UpdateOutcome::Failed;
    UpdateErrorCode code = UpdateErrorCode::Io;
    std::string message;

    static UpdateError Rejected(UpdateErrorCode code, std::string message) {
        return {UpdateOutcome::Rejected, code, std::move(message)};
    }
    static UpdateError Failed(UpdateErrorCode code, std::string message) {
        return {UpdateOutcome::Failed, code, std::move(message)};
    }

    bool Retryable() const { return outcome == UpdateOutcome::Failed; }
};

} // namespace hubagent
