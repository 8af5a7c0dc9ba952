#pragma once

#include "engine/block_map.hpp"
#include "engine/operation.hpp"
#include "engine/progress_parser.hpp"
#include "engine/run_stats.hpp"
#include "system/child_process.hpp"
#include "util/log_sink.hpp"
#include "util/result.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ddi {

// One supervised execution of the external copy command. Owned by the
// controller; the child process inside is reaped before a terminal state is
// published.
class OperationRun {
  public:
    OperationRun(const OperationRun&) = delete;
    OperationRun& operator=(const OperationRun&) = delete;

    const OperationRequest& Request() const { return request_; }
    OperationKind Kind() const { return request_.kind; }
    OperationState State() const { return state_; }
    ViewMode View() const { return view_; }

    const BlockMapModel& BlockMap() const { return block_map_; }
    const RunStats& Stats() const { return stats_; }

    double Percent() const { return stats_.Percent(); }
    double Rate() const { return stats_.Rate(); }
    std::optional<double> Eta() const { return stats_.Eta(); }
    std::uint64_t ErrorCount() const { return stats_.ErrorCount(); }
    std::uint64_t BytesTransferred() const { return stats_.BytesTransferred(); }

    // Also the process group id of the whole pipeline.
    pid_t Pid() const { return child_.Pid(); }
    std::optional<int> ExitCode() const { return exit_code_; }
    std::optional<std::uint64_t> LastErrorOffset() const { return last_error_offset_; }
    bool Cancelled() const { return cancelled_; }
    bool TargetFull() const { return parser_.TargetFull(); }
    std::uint64_t AnomalyCount() const { return parser_.AnomalyCount(); }
    const std::string& FailureReason() const { return failure_reason_; }
    std::vector<std::string> Diagnostics() const { return parser_.Diagnostics(); }

    // Wall time since start, frozen once the run is terminal.
    double ElapsedSeconds(std::chrono::steady_clock::time_point now) const;

  private:
    friend class OperationController;

    OperationRun(const OperationRequest& request,
                 std::uint32_t cell_count,
                 RunStats::Window window,
                 LogSink& log);

    OperationRequest request_;
    OperationState state_ = OperationState::Starting;
    ViewMode view_;
    BlockMapModel block_map_;
    RunStats stats_;
    ProgressParser parser_;
    ChildProcess child_;

    std::optional<int> exit_code_;
    std::optional<std::uint64_t> last_error_offset_;
    bool cancelled_ = false;
    bool escalated_ = false;
    std::string failure_reason_;
    std::chrono::steady_clock::time_point cancel_deadline_{};
    std::chrono::steady_clock::time_point kill_deadline_{};
    std::optional<std::chrono::steady_clock::time_point> finished_at_;
};

// Drives a single OperationRun: spawn, drain the status stream into the
// models, cancel with SIGTERM -> grace period -> SIGKILL, reap. Pump() never
// blocks on the child, so it can share a poll loop with terminal input.
class OperationController {
  public:
    // Worst-case cancel latency is kDefaultCancelGrace + kDefaultKillWait.
    static constexpr std::chrono::milliseconds kDefaultCancelGrace{5000};
    static constexpr std::chrono::milliseconds kDefaultKillWait{2000};

    struct Options {
        std::chrono::milliseconds cancel_grace = kDefaultCancelGrace;
        std::chrono::milliseconds kill_wait = kDefaultKillWait;
        RunStats::Window rate_window{};
        std::size_t max_read_per_pump = 256 * 1024;
    };

    explicit OperationController(LogSink& log);
    OperationController(LogSink& log, Options opt);
    ~OperationController();

    OperationController(const OperationController&) = delete;
    OperationController& operator=(const OperationController&) = delete;

    // Rejected (EBUSY) while another run is active or its process is still
    // alive. On spawn failure no run is created and the error is returned.
    Result Start(const OperationRequest& request, std::uint32_t cell_count);

    bool HasActiveRun() const;

    // True after a cancel timeout until the process is finally reaped by a
    // later Pump(). No new run can start meanwhile.
    bool HasUnreapedChild() const;
    const OperationRun* Run() const { return run_.get(); }
    std::optional<OperationState> State() const;

    // Safe to call from any thread; acted upon by the next Pump().
    void RequestCancel();

    // Local display state only; the models and the child are untouched.
    void ToggleView();

    // Reads pending status output, updates the models, advances the cancel
    // sequence and checks for exit. Returns true if anything visible changed.
    bool Pump();

    // Status pipe to poll, or -1 when there is nothing to wait on.
    int StatusFd() const;

    // Caps a poll timeout while the controller is waiting on deadlines.
    int PollTimeoutMs(int idle_ms) const;

    const Options& GetOptions() const { return opt_; }

  private:
    bool Drain(bool until_eof);
    void Apply(const std::vector<ProgressSample>& samples);
    void BeginCancel();
    bool AdvanceCancel();
    void Finish();
    void SetTerminal(OperationState state);

    LogSink& log_;
    Options opt_;
    std::unique_ptr<OperationRun> run_;
    std::atomic_bool cancel_requested_{false};
};

} // namespace ddi
