#pragma once

#include "hubagent/crypto/sha256.hpp"
#include "hubagent/util/base64.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace testutil {

// Public key and signature published with the production agent; the
// signature covers SHA-256("test").
inline constexpr const char* kProductionPublicKey =
    "xSHbUBG7LTuNfXd3zod4EX8_Es8FTCINgrjvx1WXFE4.plCHzlDAeb3IWW1wK6P6paMRYO4f8qceV3lrNCqNpWo";
inline constexpr const char* kTestContent = "test";
inline constexpr const char* kTestDigest =
    "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";
inline constexpr const char* kTestSignature =
    "MEYCIQCbbgslVegJXFczWSLP0lFKflbXdOtgMWslm/AQy1nIRQIhALjSztLgg4JltImIy33adWkH3WHS3+5F/aI1jk5/KrB8";

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/hubagent_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

inline std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

inline void WriteFile(const std::string& path, const std::string& data, mode_t mode = 0644) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) throw std::runtime_error("cannot write " + path);
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    os.close();
    ::chmod(path.c_str(), mode);
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline mode_t FileMode(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    return st.st_mode & 07777;
}

// File names in a directory, sorted.
inline std::vector<std::string> ListDirectory(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

// Freshly generated P-256 key pair for signing test binaries.
class TestSigner {
  public:
    TestSigner() {
        key_ = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256");
        if (!key_) throw std::runtime_error("EVP_PKEY_Q_keygen failed");
    }
    ~TestSigner() { EVP_PKEY_free(key_); }

    TestSigner(const TestSigner&) = delete;
    TestSigner& operator=(const TestSigner&) = delete;

    // "<x>.<y>" as accepted by SignatureVerifier.
    std::string PublicKey() const { return Coordinate(OSSL_PKEY_PARAM_EC_PUB_X) + "." +
                                           Coordinate(OSSL_PKEY_PARAM_EC_PUB_Y); }

    // DER ECDSA signature over the digest bytes.
    std::vector<std::uint8_t> SignDigest(std::span<const std::uint8_t> digest) const {
        EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_from_pkey(nullptr, key_, nullptr);
        if (!ctx || EVP_PKEY_sign_init(ctx) != 1) {
            EVP_PKEY_CTX_free(ctx);
            throw std::runtime_error("EVP_PKEY_sign_init failed");
        }
        size_t len = 0;
        if (EVP_PKEY_sign(ctx, nullptr, &len, digest.data(), digest.size()) != 1) {
            EVP_PKEY_CTX_free(ctx);
            throw std::runtime_error("EVP_PKEY_sign (size) failed");
        }
        std::vector<std::uint8_t> sig(len);
        if (EVP_PKEY_sign(ctx, sig.data(), &len, digest.data(), digest.size()) != 1) {
            EVP_PKEY_CTX_free(ctx);
            throw std::runtime_error("EVP_PKEY_sign failed");
        }
        EVP_PKEY_CTX_free(ctx);
        sig.resize(len);
        return sig;
    }

    // Metadata fields for `content`: hex digest and base64 signature.
    std::string DigestHex(const std::string& content) const {
        return hubagent::Sha256Hex(Bytes(content));
    }
    std::string SignatureFor(const std::string& content) const {
        auto digest = hubagent::Sha256Hex(Bytes(content));
        std::array<std::uint8_t, 32> raw{};
        for (size_t i = 0; i < raw.size(); ++i) {
            raw[i] = static_cast<std::uint8_t>(std::stoi(digest.substr(i * 2, 2), nullptr, 16));
        }
        return hubagent::Base64Encode(SignDigest(raw));
    }

  private:
    std::string Coordinate(const char* name) const {
        BIGNUM* bn = nullptr;
        if (EVP_PKEY_get_bn_param(key_, name, &bn) != 1) {
            throw std::runtime_error("EVP_PKEY_get_bn_param failed");
        }
        std::array<std::uint8_t, 32> buf{};
        const int n = BN_bn2binpad(bn, buf.data(), static_cast<int>(buf.size()));
        BN_free(bn);
        if (n != 32) throw std::runtime_error("BN_bn2binpad failed");
        return hubagent::Base64RawUrlEncode(buf);
    }

    EVP_PKEY* key_ = nullptr;
};

} // namespace testutil
