#include "io/fd.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace ddi {

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

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

Result Fd::SetNonBlocking() {
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0)
        return Result::FromErrno("fcntl(F_GETFL)");
    if (::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0)
        return Result::FromErrno("fcntl(F_SETFL)");
    return Result::Ok();
}

Result Fd::Pipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
        return Result::FromErrno("pipe2");
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

} // namespace ddi
