#include "hubagent/crypto/signature_verifier.hpp"

#include "openssl_ptr.hpp"

#include "hubagent/util/base64.hpp"

#include <openssl/core_names.h>
#include <openssl/err.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace hubagent {

namespace {

constexpr size_t kCoordinateSize = 32;
constexpr std::uint8_t kUncompressedPoint = 0x04;

void AppendCoordinate(std::string_view encoded, const char* name, std::vector<std::uint8_t>& out) {
    auto bytes = Base64RawUrlDecode(encoded);
    if (!bytes) {
        throw std::invalid_argument(std::string("invalid public signing key: cannot decode ") +
                                    name + " coordinate: " + bytes.error());
    }
    if (bytes->empty() || bytes->size() > kCoordinateSize) {
        throw std::invalid_argument(std::string("invalid public signing key: ") + name +
                                    " coordinate has " + std::to_string(bytes->size()) +
                                    " bytes");
    }
    // Encoders of big integers drop leading zero bytes.
    out.insert(out.end(), kCoordinateSize - bytes->size(), 0);
    out.insert(out.end(), bytes->begin(), bytes->end());
}

} // namespace

struct SignatureVerifier::Impl {
    detail::EvpPkeyPtr pkey;
};

SignatureVerifier::SignatureVerifier(std::string_view encoded_public_key)
    : impl_(std::make_unique<Impl>()) {
    const size_t dot = encoded_public_key.find('.');
    if (dot == std::string_view::npos ||
        encoded_public_key.find('.', dot + 1) != std::string_view::npos) {
        throw std::invalid_argument("invalid public signing key: expected <x>.<y>");
    }

    std::vector<std::uint8_t> point;
    point.reserve(1 + 2 * kCoordinateSize);
    point.push_back(kUncompressedPoint);
    AppendCoordinate(encoded_public_key.substr(0, dot), "x", point);
    AppendCoordinate(encoded_public_key.substr(dot + 1), "y", point);

    detail::OsslParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld ||
        OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, "prime256v1", 0) != 1 ||
        OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()) != 1) {
        throw std::runtime_error("cannot build EC key parameters");
    }
    detail::OsslParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
    if (!params) {
        throw std::runtime_error("cannot build EC key parameters");
    }

    detail::EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
        throw std::runtime_error("cannot initialize EC key import");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.get()) <= 0) {
        ERR_clear_error();
        throw std::invalid_argument("invalid public signing key: not a P-256 point");
    }
    impl_->pkey.reset(raw);

    detail::EvpPkeyCtxPtr check(EVP_PKEY_CTX_new_from_pkey(nullptr, raw, nullptr));
    if (!check || EVP_PKEY_public_check(check.get()) != 1) {
        ERR_clear_error();
        throw std::invalid_argument("invalid public signing key: point fails validation");
    }
}

SignatureVerifier::SignatureVerifier(SignatureVerifier&&) noexcept = default;
SignatureVerifier& SignatureVerifier::operator=(SignatureVerifier&&) noexcept = default;
SignatureVerifier::~SignatureVerifier() = default;

bool SignatureVerifier::Verify(std::span<const std::uint8_t> digest,
                               std::span<const std::uint8_t> signature) const {
    if (!impl_ || !impl_->pkey || digest.empty() || signature.empty()) return false;

    detail::EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, impl_->pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_verify_init(ctx.get()) != 1) {
        ERR_clear_error();
        return false;
    }

    const int rc = EVP_PKEY_verify(ctx.get(),
                                   signature.data(), signature.size(),
                                   digest.data(), digest.size());
    // Malformed DER leaves entries on this thread's error queue.
    ERR_clear_error();
    return rc == 1;
}

} // namespace hubagent
