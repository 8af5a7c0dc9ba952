#pragma once

#include "ui/progress_view.hpp"
#include "util/result.hpp"

#include <string>
#include <termios.h>

namespace ddi {

struct TerminalSize {
    int width = 80;
    int height = 24;
};

bool IsTty(int fd);

// TIOCGWINSZ on `fd`; falls back to 80x24.
TerminalSize QueryTerminalSize(int fd);

// Non-canonical, no echo, non-blocking stdin for the lifetime of the guard.
class RawTerminalGuard {
  public:
    explicit RawTerminalGuard(int fd);
    ~RawTerminalGuard();

    RawTerminalGuard(const RawTerminalGuard&) = delete;
    RawTerminalGuard& operator=(const RawTerminalGuard&) = delete;

    bool Active() const { return active_; }

  private:
    int fd_;
    bool active_ = false;
    termios old_{};
    int old_flags_ = 0;
};

// Alternate screen with hidden cursor; restored on destruction.
class ScreenGuard {
  public:
    explicit ScreenGuard(int fd);
    ~ScreenGuard();

    ScreenGuard(const ScreenGuard&) = delete;
    ScreenGuard& operator=(const ScreenGuard&) = delete;

  private:
    int fd_;
};

Result WriteAll(int fd, const std::string& data);

// Redraws the whole frame from the top-left corner, clearing leftovers.
Result Present(int fd, const Frame& frame);

} // namespace ddi
