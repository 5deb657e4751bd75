#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace hubagent {

// ECDSA P-256 verifier bound to one public key.
//
// The key is given as "<x>.<y>": the big-endian affine coordinates, each
// base64url encoded without padding. Construction throws
// std::invalid_argument when the key cannot be decoded or is not a point on
// the curve; a device with a broken embedded key must not attempt updates.
class SignatureVerifier {
public:
    explicit SignatureVerifier(std::string_view encoded_public_key);
    SignatureVerifier(const SignatureVerifier&) = delete;
    SignatureVerifier& operator=(const SignatureVerifier&) = delete;
    SignatureVerifier(SignatureVerifier&&) noexcept;
    SignatureVerifier& operator=(SignatureVerifier&&) noexcept;
    ~SignatureVerifier();

    // Checks an ASN.1 DER signature over `digest` as-is (the digest is not
    // hashed again). Safe to call concurrently.
    bool Verify(std::span<const std::uint8_t> digest,
                std::span<const std::uint8_t> signature) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hubagent
