#include "hubagent/update/binary_verifier.hpp"

#include "hubagent/crypto/sha256.hpp"
#include "hubagent/util/base64.hpp"

#include <algorithm>
#include <cctype>

namespace hubagent {

namespace {

std::string NormalizeHex(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // namespace

std::expected<void, UpdateError> VerifyBinary(const std::string& path,
                                              const UpdateMetadata& metadata,
                                              const SignatureVerifier& verifier) {
    if (metadata.digest.empty() || metadata.signature.empty()) {
        return std::unexpected(UpdateError::Rejected(UpdateErrorCode::MissingMetadata,
                                                     "missing digest or signature"));
    }

    auto digest = Sha256File(path);
    if (!digest) {
        return std::unexpected(UpdateError::Failed(UpdateErrorCode::Io,
                                                   "cannot hash " + path + ": " + digest.error()));
    }

    const std::string actual = HexEncode(*digest);
    if (actual != NormalizeHex(metadata.digest)) {
        return std::unexpected(UpdateError::Rejected(
            UpdateErrorCode::DigestMismatch,
            "digest mismatch: " + actual + " != " + metadata.digest));
    }

    auto signature = Base64Decode(metadata.signature);
    if (!signature) {
        return std::unexpected(UpdateError::Rejected(
            UpdateErrorCode::SignatureDecode, "cannot decode signature: " + signature.error()));
    }

    if (!verifier.Verify(*digest, *signature)) {
        return std::unexpected(
            UpdateError::Rejected(UpdateErrorCode::SignatureMismatch, "signature mismatch"));
    }
    return {};
}

} // namespace hubagent
