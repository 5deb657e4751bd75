#include "hubagent/update/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace hubagent {

Result TempFile::CreateFor(const std::string& destination, TempFile& out) {
    const std::filesystem::path dst(destination);
    const std::string base = dst.filename().string();
    if (base.empty()) {
        return Result::Fail(EINVAL, "destination has no file name: " + destination);
    }

    std::filesystem::path dir = dst.parent_path();
    if (dir.empty()) dir = ".";
    const std::string tmpl = (dir / ("." + base + ".XXXXXX")).string();

    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "mkstemp " + tmpl + ": " + std::strerror(e));
    }

    out = TempFile{};
    out.fd_.Reset(fd);
    out.path_ = buf.data();

    if (::fchmod(fd, 0600) != 0) {
        const int e = errno;
        out.Cleanup();
        return Result::Fail(e, "fchmod " + tmpl + ": " + std::strerror(e));
    }
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

Result TempFile::SyncAndClose() {
    if (!fd_.Valid()) return Result::Fail(EBADF, "temp file already closed");

    if (::fsync(fd_.Get()) != 0) {
        const int e = errno;
        fd_.Close();
        return Result::Fail(e, "fsync " + path_ + ": " + std::strerror(e));
    }
    if (const int e = fd_.Close(); e != 0) {
        return Result::Fail(e, "close " + path_ + ": " + std::strerror(e));
    }
    return Result::Ok();
}

void TempFile::Release() {
    fd_.Close();
    path_.clear();
}

void TempFile::Cleanup() {
    fd_.Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace hubagent
