#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <sys/types.h>
#include <vector>

namespace ddi {

struct ExitStatus {
    bool exited = false;  // normal exit (WIFEXITED)
    int code = -1;        // exit code, or 128 + signal when killed
    int signal = 0;       // terminating signal, 0 if none

    bool Signaled() const { return signal != 0; }
};

// One external command running in its own process group. stdin/stdout are
// bound to /dev/null and stderr to a non-blocking pipe (the status stream).
// The leader is reaped exactly once; a still-running group is killed and
// reaped on destruction.
class ChildProcess {
  public:
    enum class ReadState {
        Data,
        WouldBlock,
        Eof,
    };

    ChildProcess() = default;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ~ChildProcess();

    // Fails (no process left behind) if fork or exec fails.
    static Result Spawn(const std::vector<std::string>& argv, ChildProcess& out);

    pid_t Pid() const { return pid_; }
    int StatusFd() const { return status_.Get(); }
    bool Started() const { return pid_ > 0; }
    bool Reaped() const { return reaped_; }
    const ExitStatus& Status() const { return exit_; }

    // Appends at most `max_bytes` of status output to `out`.
    Result ReadStatus(std::string& out, std::size_t max_bytes, ReadState& state);
    void CloseStatus() { status_.Close(); }

    Result SignalGroup(int sig);

    // Non-blocking waitpid on the leader. `reaped` reports the current state.
    Result TryReap(bool& reaped);

    // Polls TryReap until reaped or `timeout` elapsed.
    bool WaitFor(std::chrono::milliseconds timeout);

    // After the leader is gone: kill what is left of the group and reap any
    // member that was re-parented to us.
    void ReapGroupStragglers(std::chrono::milliseconds timeout);

  private:
    void KillAndReap();

    pid_t pid_ = -1;
    Fd status_;
    bool reaped_ = false;
    ExitStatus exit_;
};

} // namespace ddi
