#include "system/child_process.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace ddi {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(5);
constexpr auto kDestroyReapWait = std::chrono::milliseconds(500);

ExitStatus DecodeWaitStatus(int st) {
    ExitStatus out;
    if (WIFEXITED(st)) {
        out.exited = true;
        out.code = WEXITSTATUS(st);
    } else if (WIFSIGNALED(st)) {
        out.signal = WTERMSIG(st);
        out.code = 128 + out.signal;
    }
    return out;
}

ssize_t ReadRetry(int fd, void* buf, size_t len) {
    ssize_t n;
    do {
        n = ::read(fd, buf, len);
    } while (n < 0 && errno == EINTR);
    return n;
}

[[noreturn]] void ExecChild(const std::vector<char*>& args, int status_fd, int report_fd) {
    ::setpgid(0, 0);

    std::signal(SIGPIPE, SIG_DFL);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
        if (devnull > STDERR_FILENO) ::close(devnull);
    }
    ::dup2(status_fd, STDERR_FILENO);

    ::execvp(args[0], args.data());

    const int err = errno;
    ssize_t ignored = ::write(report_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

} // namespace

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), status_(std::move(other.status_)), reaped_(other.reaped_),
      exit_(other.exit_) {
    other.pid_ = -1;
    other.reaped_ = false;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        KillAndReap();
        pid_ = other.pid_;
        status_ = std::move(other.status_);
        reaped_ = other.reaped_;
        exit_ = other.exit_;
        other.pid_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

ChildProcess::~ChildProcess() { KillAndReap(); }

Result ChildProcess::Spawn(const std::vector<std::string>& argv, ChildProcess& out) {
    if (argv.empty() || argv.front().empty())
        return Result::Fail(EINVAL, "empty command line");

    Fd status_r, status_w;
    if (auto r = Fd::Pipe(status_r, status_w); !r.ok)
        return r;
    Fd report_r, report_w;
    if (auto r = Fd::Pipe(report_r, report_w); !r.ok)
        return r;

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0)
        return Result::FromErrno("fork");
    if (pid == 0)
        ExecChild(args, status_w.Get(), report_w.Get());

    // Either side may win the race to create the group.
    (void)::setpgid(pid, pid);
    status_w.Close();
    report_w.Close();

    int child_errno = 0;
    const ssize_t n = ReadRetry(report_r.Get(), &child_errno, sizeof(child_errno));
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
        }
        return Result::Fail(child_errno,
                            "cannot execute " + argv.front() + ": " + std::strerror(child_errno));
    }

    if (auto r = status_r.SetNonBlocking(); !r.ok) {
        ::kill(pid, SIGKILL);
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
        }
        return r;
    }

    out = ChildProcess{};
    out.pid_ = pid;
    out.status_ = std::move(status_r);
    LogDebug("spawned pid=%d: %s", static_cast<int>(pid), argv.front().c_str());
    return Result::Ok();
}

Result ChildProcess::ReadStatus(std::string& out, std::size_t max_bytes, ReadState& state) {
    state = ReadState::WouldBlock;
    if (!status_.Valid()) {
        state = ReadState::Eof;
        return Result::Ok();
    }

    char buf[4096];
    std::size_t total = 0;
    while (total < max_bytes) {
        const std::size_t want = std::min(sizeof(buf), max_bytes - total);
        const ssize_t n = ReadRetry(status_.Get(), buf, want);
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
            total += static_cast<std::size_t>(n);
            state = ReadState::Data;
            continue;
        }
        if (n == 0) {
            if (total == 0) state = ReadState::Eof;
            return Result::Ok();
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return Result::Ok();
        return Result::FromErrno("read status pipe");
    }
    return Result::Ok();
}

Result ChildProcess::SignalGroup(int sig) {
    if (pid_ <= 0 || reaped_)
        return Result::Ok();
    if (::killpg(pid_, sig) != 0) {
        if (errno == ESRCH)
            return Result::Ok();
        return Result::FromErrno("killpg");
    }
    return Result::Ok();
}

Result ChildProcess::TryReap(bool& reaped) {
    reaped = reaped_;
    if (pid_ <= 0 || reaped_)
        return Result::Ok();

    int st = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &st, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0)
        return Result::Ok();
    if (r < 0) {
        // Someone else reaped it; the exit status is lost.
        reaped_ = true;
        reaped = true;
        return Result::FromErrno("waitpid");
    }

    reaped_ = true;
    reaped = true;
    exit_ = DecodeWaitStatus(st);
    return Result::Ok();
}

bool ChildProcess::WaitFor(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        bool reaped = false;
        auto r = TryReap(reaped);
        if (reaped || !r.ok)
            return reaped;
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

void ChildProcess::ReapGroupStragglers(std::chrono::milliseconds timeout) {
    if (pid_ <= 0)
        return;
    if (::killpg(pid_, 0) != 0)
        return;

    LogDebug("process group %d outlived its leader, killing", static_cast<int>(pid_));
    (void)::killpg(pid_, SIGKILL);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const pid_t r = ::waitpid(-pid_, nullptr, WNOHANG);
        if (r > 0)
            continue;
        if (r < 0 && errno == EINTR)
            continue;
        if (r < 0)
            return;  // ECHILD: nothing of the group is ours to reap
        if (std::chrono::steady_clock::now() >= deadline)
            return;
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

void ChildProcess::KillAndReap() {
    if (pid_ > 0 && !reaped_) {
        (void)::killpg(pid_, SIGKILL);
        // A process stuck in uninterruptible I/O is left to init.
        if (!WaitFor(kDestroyReapWait))
            LogWarn("pid %d still alive after SIGKILL, abandoning it", static_cast<int>(pid_));
    }
    if (pid_ > 0)
        ReapGroupStragglers(std::chrono::milliseconds(0));
    status_.Close();
    pid_ = -1;
}

} // namespace ddi
