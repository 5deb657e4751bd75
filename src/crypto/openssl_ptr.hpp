#pragma once

#include <memory>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/params.h>

namespace hubagent::detail {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* p) const { if (p) EVP_PKEY_free(p); }
};

struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const { if (p) EVP_PKEY_CTX_free(p); }
};

struct OsslParamDeleter {
    void operator()(OSSL_PARAM* p) const { if (p) OSSL_PARAM_free(p); }
};

struct OsslParamBldDeleter {
    void operator()(OSSL_PARAM_BLD* p) const { if (p) OSSL_PARAM_BLD_free(p); }
};

struct BignumDeleter {
    void operator()(BIGNUM* p) const { if (p) BN_free(p); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using OsslParamPtr = std::unique_ptr<OSSL_PARAM, OsslParamDeleter>;
using OsslParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, OsslParamBldDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

} // namespace hubagent::detail
