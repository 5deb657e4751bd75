#include "hubagent/io/fd.hpp"

#include <cerrno>
#include <unistd.h>

namespace hubagent {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Close() {
    int err = 0;
    if (fd_ >= 0 && ::close(fd_) != 0) {
        err = errno;
    }
    fd_ = -1;
    return err;
}

} // namespace hubagent
