#pragma once

#include "hubagent/crypto/signature_verifier.hpp"
#include "hubagent/update/metadata.hpp"
#include "hubagent/update/update_error.hpp"

#include <expected>
#include <string>

namespace hubagent {

// Checks a file on disk against published metadata: the SHA-256 must equal
// metadata.digest (hex, case-insensitive) and metadata.signature must be a
// valid signature over the raw digest bytes.
std::expected<void, UpdateError> VerifyBinary(const std::string& path,
                                              const UpdateMetadata& metadata,
                                              const SignatureVerifier& verifier);

} // namespace hubagent
