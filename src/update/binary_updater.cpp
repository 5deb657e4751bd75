#include "hubagent/update/binary_updater.hpp"

#include "hubagent/io/fd.hpp"
#include "hubagent/io/fd_writer.hpp"
#include "hubagent/update/binary_verifier.hpp"
#include "hubagent/update/temp_file.hpp"
#include "hubagent/util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <sys/utsname.h>
#include <system_error>
#include <unistd.h>

namespace hubagent {

namespace {

// Remembers why the staging file refused data, so that an aborted download
// can be told apart from a network failure.
class StagingSink final : public IWriter {
public:
    explicit StagingSink(int fd) : writer_(fd) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        auto r = writer_.WriteAll(in);
        if (!r.is_ok() && failure_.is_ok()) failure_ = r;
        return r;
    }
    Result FsyncNow() override { return writer_.FsyncNow(); }

    const Result& Failure() const { return failure_; }
    std::uint64_t BytesWritten() const { return writer_.BytesWritten(); }

private:
    FdWriter writer_;
    Result failure_;
};

std::string LockKey(const std::string& destination) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(destination, ec);
    if (ec) return std::filesystem::path(destination).lexically_normal().string();
    return abs.lexically_normal().string();
}

Result SyncDirectory(const std::string& path) {
    std::string dir = std::filesystem::path(path).parent_path().string();
    if (dir.empty()) dir = ".";

    Fd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.Valid()) {
        const int e = errno;
        return Result::Fail(e, "open " + dir + ": " + std::strerror(e));
    }
    if (::fsync(fd.Get()) != 0) {
        const int e = errno;
        return Result::Fail(e, "fsync " + dir + ": " + std::strerror(e));
    }
    return Result::Ok();
}

UpdateError FromHubError(const hub::Error& err) {
    if (err.IsHttp()) {
        return UpdateError::Failed(UpdateErrorCode::Http, err.ToString());
    }
    return UpdateError::Failed(UpdateErrorCode::Connection, err.ToString());
}

} // namespace

const char* ToString(UpdateState state) {
    switch (state) {
        case UpdateState::Requested: return "requested";
        case UpdateState::Staging:   return "staging";
        case UpdateState::Verifying: return "verifying";
        case UpdateState::Installed: return "installed";
        case UpdateState::Rejected:  return "rejected";
        case UpdateState::Failed:    return "failed";
    }
    return "unknown";
}

std::string HostArchitecture() {
#if defined(__x86_64__)
    return "amd64";
#elif defined(__aarch64__)
    return "arm64";
#elif defined(__arm__)
    return "arm";
#elif defined(__i386__)
    return "386";
#elif defined(__riscv) && __riscv_xlen == 64
    return "riscv64";
#else
    struct utsname u {};
    if (::uname(&u) != 0) return "unknown";
    return u.machine;
#endif
}

std::string BinaryDownloadPath(const std::string& name, const std::string& arch) {
    return "/v1/org/device/auth/download/" + name + "/" + arch;
}

BinaryUpdater::BinaryUpdater(const hub::HubClient& client, const SignatureVerifier& verifier)
    : client_(client), verifier_(verifier), arch_(HostArchitecture()) {}

// Holds the per-destination lock for one attempt and drops the table entry
// when the last user leaves.
class BinaryUpdater::DestinationGuard {
public:
    DestinationGuard(BinaryUpdater& owner, const std::string& destination)
        : owner_(owner), key_(LockKey(destination)) {
        {
            std::lock_guard<std::mutex> lk(owner_.table_mu_);
            // std::map nodes never move; users > 0 keeps this one alive.
            slot_ = &owner_.destination_locks_[key_];
            ++slot_->users;
        }
        slot_->mu.lock();
    }

    ~DestinationGuard() {
        slot_->mu.unlock();
        std::lock_guard<std::mutex> lk(owner_.table_mu_);
        if (--slot_->users == 0) {
            owner_.destination_locks_.erase(key_);
        }
    }

    DestinationGuard(const DestinationGuard&) = delete;
    DestinationGuard& operator=(const DestinationGuard&) = delete;

private:
    BinaryUpdater& owner_;
    std::string key_;
    DestinationLock* slot_ = nullptr;
};

size_t BinaryUpdater::TrackedDestinations() const {
    std::lock_guard<std::mutex> lk(table_mu_);
    return destination_locks_.size();
}

std::expected<UpdateMetadata, UpdateError> BinaryUpdater::Update(const hub::CallContext& ctx,
                                                                 const std::string& name,
                                                                 const std::string& destination) {
    DestinationGuard guard(*this, destination);

    LogInfo("update %s: %s (destination %s, arch %s)", name.c_str(),
            ToString(UpdateState::Requested), destination.c_str(), arch_.c_str());

    auto res = Run(ctx, name, destination);
    if (!res) {
        const auto& err = res.error();
        if (err.outcome == UpdateOutcome::Rejected) {
            LogError("update %s: %s: %s", name.c_str(), ToString(UpdateState::Rejected),
                     err.message.c_str());
        } else {
            LogWarn("update %s: %s: %s", name.c_str(), ToString(UpdateState::Failed),
                    err.message.c_str());
        }
    }
    return res;
}

std::expected<UpdateMetadata, UpdateError> BinaryUpdater::Run(const hub::CallContext& ctx,
                                                              const std::string& name,
                                                              const std::string& destination) {
    TempFile tmp;
    if (auto r = TempFile::CreateFor(destination, tmp); !r.is_ok()) {
        return std::unexpected(UpdateError::Failed(UpdateErrorCode::Filesystem, r.msg));
    }

    LogInfo("update %s: %s into %s", name.c_str(), ToString(UpdateState::Staging),
            tmp.Path().c_str());

    StagingSink sink(tmp.GetFd());
    auto response = client_.Download(ctx, BinaryDownloadPath(name, arch_), sink);
    if (!response) {
        if (!sink.Failure().is_ok()) {
            return std::unexpected(UpdateError::Failed(
                UpdateErrorCode::Filesystem, "write " + tmp.Path() + ": " + sink.Failure().msg));
        }
        return std::unexpected(FromHubError(response.error()));
    }

    const UpdateMetadata metadata = UpdateMetadata::FromHeaders(response->headers);
    if (metadata.digest.empty() || metadata.signature.empty()) {
        return std::unexpected(UpdateError::Rejected(
            UpdateErrorCode::MissingMetadata,
            "download response lacks X-Binary-Digest or X-Binary-Signature"));
    }

    if (auto r = tmp.SyncAndClose(); !r.is_ok()) {
        return std::unexpected(UpdateError::Failed(UpdateErrorCode::Filesystem, r.msg));
    }

    LogInfo("update %s: %s version %s (%llu bytes)", name.c_str(),
            ToString(UpdateState::Verifying), metadata.version.c_str(),
            static_cast<unsigned long long>(sink.BytesWritten()));

    if (auto v = VerifyBinary(tmp.Path(), metadata, verifier_); !v) {
        return std::unexpected(v.error());
    }

    if (::chmod(tmp.Path().c_str(), 0700) != 0) {
        const int e = errno;
        return std::unexpected(UpdateError::Failed(
            UpdateErrorCode::Filesystem, "chmod " + tmp.Path() + ": " + std::strerror(e)));
    }

    if (::rename(tmp.Path().c_str(), destination.c_str()) != 0) {
        const int e = errno;
        return std::unexpected(UpdateError::Failed(
            UpdateErrorCode::Filesystem,
            "rename " + tmp.Path() + " -> " + destination + ": " + std::strerror(e)));
    }
    tmp.Release();

    // Already installed at this point.
    if (auto r = SyncDirectory(destination); !r.is_ok()) {
        LogWarn("update %s: %s", name.c_str(), r.msg.c_str());
    }

    LogInfo("update %s: %s version %s at %s", name.c_str(), ToString(UpdateState::Installed),
            metadata.version.c_str(), destination.c_str());
    return metadata;
}

} // namespace hubagent
