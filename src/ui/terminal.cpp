#include "ui/terminal.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace ddi {

bool IsTty(int fd) {
    return ::isatty(fd) == 1;
}

TerminalSize QueryTerminalSize(int fd) {
    TerminalSize size;
    winsize ws{};
    if (::ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        size.width = ws.ws_col;
        size.height = ws.ws_row;
    }
    return size;
}

RawTerminalGuard::RawTerminalGuard(int fd) : fd_(fd) {
    if (!IsTty(fd_) || ::tcgetattr(fd_, &old_) != 0)
        return;
    termios raw = old_;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(fd_, TCSANOW, &raw) != 0)
        return;
    old_flags_ = ::fcntl(fd_, F_GETFL, 0);
    if (old_flags_ >= 0)
        (void)::fcntl(fd_, F_SETFL, old_flags_ | O_NONBLOCK);
    active_ = true;
}

RawTerminalGuard::~RawTerminalGuard() {
    if (!active_)
        return;
    (void)::tcsetattr(fd_, TCSANOW, &old_);
    if (old_flags_ >= 0)
        (void)::fcntl(fd_, F_SETFL, old_flags_);
}

ScreenGuard::ScreenGuard(int fd) : fd_(fd) {
    (void)WriteAll(fd_, "\x1B[?1049h\x1B[?25l\x1B[2J\x1B[H");
}

ScreenGuard::~ScreenGuard() {
    (void)WriteAll(fd_, "\x1B[?25h\x1B[?1049l");
}

Result WriteAll(int fd, const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Result::FromErrno("write");
        }
        off += static_cast<std::size_t>(n);
    }
    return Result::Ok();
}

Result Present(int fd, const Frame& frame) {
    std::string buf = "\x1B[H";
    for (std::size_t i = 0; i < frame.size(); ++i) {
        if (i > 0)
            buf += "\r\n";
        buf += frame[i];
        buf += "\x1B[K";
    }
    buf += "\x1B[J";
    return WriteAll(fd, buf);
}

} // namespace ddi
