#include "ui/progress_session.hpp"

#include "system/signals.hpp"
#include "ui/progress_view.hpp"
#include "ui/terminal.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <optional>
#include <poll.h>

namespace ddi {

namespace {

constexpr int kDismissPollMs = 250;

int MillisUntil(std::chrono::steady_clock::time_point deadline,
                std::chrono::steady_clock::time_point now) {
    if (deadline <= now)
        return 0;
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()) + 1;
}

// Restores console logging when the full-screen view goes away.
class ConsoleMute {
  public:
    explicit ConsoleMute(bool active) : active_(active) {
        if (!active_)
            return;
        previous_ = Logger::Instance().ConsoleEnabled();
        Logger::Instance().SetConsoleEnabled(false);
    }
    ~ConsoleMute() {
        if (active_)
            Logger::Instance().SetConsoleEnabled(previous_);
    }

    ConsoleMute(const ConsoleMute&) = delete;
    ConsoleMute& operator=(const ConsoleMute&) = delete;

  private:
    bool active_;
    bool previous_ = true;
};

} // namespace

ProgressSession::ProgressSession(OperationController& ctrl, LogSink& log, Options opt)
    : ctrl_(ctrl), log_(log), opt_(opt) {}

int ProgressSession::PageSize() const {
    return std::max(1, height_ / 2);
}

void ProgressSession::HandleKey(KeyEvent key) {
    const std::size_t max_scroll = log_.Size() > 0 ? log_.Size() - 1 : 0;
    const auto page = static_cast<std::size_t>(PageSize());
    const OperationRun* run = ctrl_.Run();
    const bool finished = run && IsTerminal(run->State());

    switch (key) {
    case KeyEvent::ScrollUp:
        log_scroll_ = std::min(max_scroll, log_scroll_ + 1);
        return;
    case KeyEvent::ScrollDown:
        log_scroll_ = log_scroll_ > 0 ? log_scroll_ - 1 : 0;
        return;
    case KeyEvent::PageUp:
        log_scroll_ = std::min(max_scroll, log_scroll_ + page);
        return;
    case KeyEvent::PageDown:
        log_scroll_ = log_scroll_ > page ? log_scroll_ - page : 0;
        return;
    case KeyEvent::Home:
        log_scroll_ = max_scroll;
        return;
    case KeyEvent::End:
        log_scroll_ = 0;
        return;
    case KeyEvent::ToggleView:
        if (!finished) {
            ctrl_.ToggleView();
            return;
        }
        break;
    case KeyEvent::Cancel:
        if (ctrl_.HasActiveRun()) {
            if (run->State() == OperationState::Running)
                log_.Write(LogLevel::Warn, "Cancel requested by user");
            ctrl_.RequestCancel();
            return;
        }
        break;
    case KeyEvent::Other:
        break;
    }
    if (finished)
        dismissed_ = true;
}

bool ProgressSession::ReadInput() {
    std::array<char, 64> buf{};
    bool any = false;
    while (true) {
        const ssize_t n = ::read(opt_.in_fd, buf.data(), buf.size());
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        for (KeyEvent k : keys_.Feed(std::string_view(buf.data(), static_cast<std::size_t>(n))))
            HandleKey(k);
        any = true;
    }
    // Everything this wakeup delivered has been read; a held ESC is a key.
    for (KeyEvent k : keys_.Flush())
        HandleKey(k);
    return any;
}

Result ProgressSession::Draw(std::chrono::steady_clock::time_point now) {
    const OperationRun* run = ctrl_.Run();
    if (!run)
        return Result::Ok();

    if (!Interactive())
        return WriteAll(opt_.out_fd, RenderPlainLine(*run, now) + "\n");

    const TerminalSize size = QueryTerminalSize(opt_.out_fd);
    height_ = size.height;
    ViewInput in{
        .run = *run,
        .log = log_.Tail(static_cast<std::size_t>(size.height), log_scroll_),
        .width = size.width,
        .height = size.height,
        .log_scroll = log_scroll_,
        .now = now,
        .color = opt_.color,
    };
    Frame frame = Render(in);
    if (frame.size() > static_cast<std::size_t>(size.height))
        frame.resize(static_cast<std::size_t>(size.height));
    return Present(opt_.out_fd, frame);
}

Result ProgressSession::WaitForDismiss() {
    std::uint64_t seq = log_.Sequence();
    while (!dismissed_) {
        if (g_cancel.exchange(false))
            break;
        (void)ctrl_.Pump();

        pollfd pfd{.fd = opt_.in_fd, .events = POLLIN, .revents = 0};
        const int rc = ::poll(&pfd, 1, kDismissPollMs);
        if (rc < 0 && errno != EINTR)
            return Result::FromErrno("poll");

        bool redraw = false;
        if (rc > 0 && (pfd.revents & (POLLIN | POLLHUP)))
            redraw = ReadInput();
        if (log_.Sequence() != seq) {
            seq = log_.Sequence();
            redraw = true;
        }
        if (redraw && !dismissed_) {
            if (auto r = Draw(std::chrono::steady_clock::now()); !r.ok)
                return r;
        }
    }
    return Result::Ok();
}

Result ProgressSession::Run() {
    if (!ctrl_.Run())
        return Result::Fail(EINVAL, "no operation started");

    interactive_ = IsTty(opt_.out_fd) && IsTty(opt_.in_fd);
    dismissed_ = false;

    ConsoleMute mute(interactive_);
    std::optional<RawTerminalGuard> raw;
    std::optional<ScreenGuard> screen;
    if (interactive_) {
        raw.emplace(opt_.in_fd);
        screen.emplace(opt_.out_fd);
    }

    using Clock = std::chrono::steady_clock;
    auto next_render = Clock::now();
    std::uint64_t seq = log_.Sequence();

    while (ctrl_.HasActiveRun()) {
        if (g_cancel.exchange(false)) {
            log_.Write(LogLevel::Warn, "Interrupted, cancelling");
            ctrl_.RequestCancel();
        }

        bool dirty = ctrl_.Pump();
        if (!ctrl_.HasActiveRun())
            break;
        if (log_.Sequence() != seq) {
            seq = log_.Sequence();
            dirty = dirty || interactive_;
        }

        auto now = Clock::now();
        if ((dirty && interactive_) || now >= next_render) {
            if (auto r = Draw(now); !r.ok)
                return r;
            next_render = now + opt_.render_interval;
        }

        std::array<pollfd, 2> fds{};
        nfds_t nfds = 0;
        const int status_fd = ctrl_.StatusFd();
        if (status_fd >= 0)
            fds[nfds++] = pollfd{.fd = status_fd, .events = POLLIN, .revents = 0};
        const nfds_t input_slot = nfds;
        if (interactive_)
            fds[nfds++] = pollfd{.fd = opt_.in_fd, .events = POLLIN, .revents = 0};

        const int timeout = ctrl_.PollTimeoutMs(MillisUntil(next_render, Clock::now()));
        const int rc = ::poll(fds.data(), nfds, timeout);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            return Result::FromErrno("poll");
        }
        if (interactive_ && rc > 0 && (fds[input_slot].revents & (POLLIN | POLLHUP))) {
            if (ReadInput()) {
                if (auto r = Draw(Clock::now()); !r.ok)
                    return r;
            }
        }
    }

    const OperationRun* run = ctrl_.Run();
    if (!interactive_)
        return WriteAll(opt_.out_fd, RenderPlainLine(*run, Clock::now()) + "\n" + ResultMessage(*run) + "\n");

    if (auto r = Draw(Clock::now()); !r.ok)
        return r;
    return WaitForDismiss();
}

} // namespace ddi
