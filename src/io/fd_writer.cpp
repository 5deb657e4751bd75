#include "hubagent/io/fd_writer.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace hubagent {

Result FdWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_, p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            written_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int err = (n == 0) ? EIO : errno;
        return Result::Fail(err, "write failed (" + std::string(std::strerror(err)) + ")");
    }

    return Result::Ok();
}

Result FdWriter::FsyncNow() {
    if (::fsync(fd_) == -1) {
        return Result::Fail(errno, "fsync failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

} // namespace hubagent
