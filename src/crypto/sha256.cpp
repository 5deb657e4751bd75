#include "hubagent/crypto/sha256.hpp"

#include "hubagent/io/file_reader.hpp"

#include <openssl/evp.h>

#include <vector>

namespace hubagent {

namespace {

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitSha256(EvpCtx& ctx) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1;
}

bool UpdateSha256(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

bool FinalSha256(EvpCtx& ctx, Sha256Digest& out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

} // namespace

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

struct Sha256Hasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool failed = false;
    bool finalized = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    impl_->initialized = InitSha256(impl_->ctx);
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

bool Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->failed || impl_->finalized) return false;
    if (!UpdateSha256(impl_->ctx, data)) {
        impl_->failed = true;
        return false;
    }
    return true;
}

std::expected<Sha256Digest, std::string> Sha256Hasher::Final() {
    if (!impl_ || !impl_->initialized) return std::unexpected("sha256 init failed");
    if (impl_->failed) return std::unexpected("sha256 update failed");
    if (impl_->finalized) return std::unexpected("sha256 already finalized");
    impl_->finalized = true;
    Sha256Digest digest{};
    if (!FinalSha256(impl_->ctx, digest)) return std::unexpected("sha256 final failed");
    return digest;
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    if (!hasher.Update(data)) return {};
    auto digest = hasher.Final();
    if (!digest) return {};
    return HexEncode(*digest);
}

std::expected<Sha256Digest, std::string> Sha256(IReader& reader) {
    Sha256Hasher hasher;

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return std::unexpected("read failed while hashing");
        if (!hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) {
            return std::unexpected("sha256 update failed");
        }
    }

    return hasher.Final();
}

std::expected<Sha256Digest, std::string> Sha256File(const std::string& path) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.ok) return std::unexpected(r.msg);
    return Sha256(reader);
}

} // namespace hubagent
