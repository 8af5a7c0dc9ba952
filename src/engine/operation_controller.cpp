#include "engine/operation_controller.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <utility>

namespace ddi {

namespace {

constexpr int kDeadlinePollMs = 20;
constexpr std::size_t kFinalDrainLimit = 16 * 1024 * 1024;
constexpr auto kStragglerWait = std::chrono::milliseconds(200);

std::string JoinArgv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

bool IsCancelSignal(int sig) {
    return sig == SIGTERM || sig == SIGKILL || sig == SIGINT;
}

// The leader is usually `sh -c`, which reports a killed pipeline stage as
// 128 + signal instead of dying from the signal itself.
bool StoppedByCancel(const ExitStatus& ex) {
    if (ex.exited && ex.code == 0)
        return true;
    if (ex.Signaled())
        return IsCancelSignal(ex.signal);
    return ex.exited && ex.code > 128 && IsCancelSignal(ex.code - 128);
}

long long Millis(std::chrono::milliseconds d) { return static_cast<long long>(d.count()); }

} // namespace

OperationRun::OperationRun(const OperationRequest& request,
                           std::uint32_t cell_count,
                           RunStats::Window window,
                           LogSink& log)
    : request_(request), view_(request.initial_view),
      block_map_(request.total_bytes, cell_count),
      stats_(request.total_bytes, window),
      parser_(log, request.block_size) {}

double OperationRun::ElapsedSeconds(std::chrono::steady_clock::time_point now) const {
    const auto end = finished_at_.value_or(now);
    const double wall = std::chrono::duration<double>(end - stats_.StartTime()).count();
    return std::max(wall, stats_.LastElapsed());
}

OperationController::OperationController(LogSink& log) : OperationController(log, Options{}) {}

OperationController::OperationController(LogSink& log, Options opt)
    : log_(log), opt_(opt) {}

OperationController::~OperationController() {
    if (HasActiveRun()) {
        LogWarn("Controller destroyed with a running %s, killing it", ToString(run_->Kind()));
    }
}

Result OperationController::Start(const OperationRequest& request, std::uint32_t cell_count) {
    if (HasActiveRun())
        return Result::Fail(EBUSY, "an operation is already running");
    if (HasUnreapedChild())
        return Result::Fail(EBUSY, "previous process has not exited yet");
    if (request.argv.empty())
        return Result::Fail(EINVAL, "empty command line");
    if (request.total_bytes == 0)
        return Result::Fail(EINVAL, "total size must be positive");

    log_.Write(LogLevel::Info, "Executing: %s", JoinArgv(request.argv).c_str());

    ChildProcess child;
    auto spawned = ChildProcess::Spawn(request.argv, child);
    if (!spawned.ok) {
        log_.Write(LogLevel::Error, "%s failed to start: %s", ToString(request.kind),
                   spawned.msg.c_str());
        return Result::Fail(spawned.err, "spawn failed: " + spawned.msg);
    }

    cancel_requested_.store(false);
    run_.reset(new OperationRun(request, cell_count, opt_.rate_window, log_));
    run_->child_ = std::move(child);
    run_->block_map_.ApplyProgress(0);
    run_->state_ = OperationState::Running;

    LogInfo("%s started: pid=%d total=%llu cells=%u bs=%llu",
            ToString(request.kind),
            static_cast<int>(run_->child_.Pid()),
            static_cast<unsigned long long>(request.total_bytes),
            run_->block_map_.CellCount(),
            static_cast<unsigned long long>(request.block_size));
    return Result::Ok();
}

bool OperationController::HasActiveRun() const {
    return run_ && !IsTerminal(run_->state_);
}

bool OperationController::HasUnreapedChild() const {
    return run_ && run_->child_.Started() && !run_->child_.Reaped();
}

std::optional<OperationState> OperationController::State() const {
    if (!run_)
        return std::nullopt;
    return run_->state_;
}

void OperationController::RequestCancel() {
    cancel_requested_.store(true);
}

void OperationController::ToggleView() {
    if (run_)
        run_->view_ = Toggled(run_->view_);
}

int OperationController::StatusFd() const {
    if (!HasActiveRun())
        return -1;
    return run_->child_.StatusFd();
}

int OperationController::PollTimeoutMs(int idle_ms) const {
    if (!HasActiveRun())
        return idle_ms;
    if (run_->state_ == OperationState::Cancelling || run_->child_.StatusFd() < 0)
        return std::min(idle_ms, kDeadlinePollMs);
    return idle_ms;
}

bool OperationController::Pump() {
    if (!run_)
        return false;

    if (IsTerminal(run_->state_)) {
        // A child that outlived the kill escalation is collected once it dies.
        if (run_->child_.Started() && !run_->child_.Reaped()) {
            bool reaped = false;
            if (auto r = run_->child_.TryReap(reaped); !r.ok)
                LogWarn("%s", r.msg.c_str());
            if (reaped)
                run_->child_.ReapGroupStragglers(std::chrono::milliseconds(0));
        }
        return false;
    }

    bool changed = false;
    if (cancel_requested_.exchange(false) && run_->state_ == OperationState::Running) {
        BeginCancel();
        changed = true;
    }

    changed |= Drain(false);

    bool reaped = false;
    auto r = run_->child_.TryReap(reaped);
    if (!r.ok)
        LogWarn("%s", r.msg.c_str());
    if (reaped) {
        Finish();
        return true;
    }

    if (run_->state_ == OperationState::Cancelling)
        changed |= AdvanceCancel();
    return changed;
}

bool OperationController::Drain(bool until_eof) {
    OperationRun& run = *run_;
    if (run.child_.StatusFd() < 0)
        return false;

    const std::size_t limit = until_eof ? kFinalDrainLimit : opt_.max_read_per_pump;
    std::string chunk;
    ChildProcess::ReadState state = ChildProcess::ReadState::WouldBlock;
    auto r = run.child_.ReadStatus(chunk, limit, state);
    if (!r.ok) {
        log_.Write(LogLevel::Warn, "Status stream lost: %s", r.msg.c_str());
        run.child_.CloseStatus();
    } else if (state == ChildProcess::ReadState::Eof) {
        run.child_.CloseStatus();
    }

    if (chunk.empty())
        return false;

    std::vector<ProgressSample> samples;
    run.parser_.Feed(chunk, samples);
    Apply(samples);
    return true;
}

void OperationController::Apply(const std::vector<ProgressSample>& samples) {
    OperationRun& run = *run_;
    for (const auto& s : samples) {
        if (s.error_at_offset) {
            run.block_map_.ApplyError(*s.error_at_offset);
            run.stats_.RecordError();
            run.last_error_offset_ = s.error_at_offset;
            continue;
        }
        run.stats_.Record(s);
        run.block_map_.ApplyProgress(s.bytes_transferred);
    }
}

void OperationController::BeginCancel() {
    OperationRun& run = *run_;
    run.state_ = OperationState::Cancelling;
    run.cancel_deadline_ = std::chrono::steady_clock::now() + opt_.cancel_grace;

    log_.Write(LogLevel::Warn, "Cancelling %s: sending SIGTERM (grace %lld ms)",
               ToString(run.Kind()), Millis(opt_.cancel_grace));
    if (auto r = run.child_.SignalGroup(SIGTERM); !r.ok)
        log_.Write(LogLevel::Error, "SIGTERM failed: %s", r.msg.c_str());
}

bool OperationController::AdvanceCancel() {
    OperationRun& run = *run_;
    const auto now = std::chrono::steady_clock::now();
    bool changed = false;

    if (!run.escalated_ && now >= run.cancel_deadline_) {
        log_.Write(LogLevel::Warn, "Process ignored SIGTERM for %lld ms, sending SIGKILL",
                   Millis(opt_.cancel_grace));
        if (auto r = run.child_.SignalGroup(SIGKILL); !r.ok)
            log_.Write(LogLevel::Error, "SIGKILL failed: %s", r.msg.c_str());
        run.escalated_ = true;
        run.kill_deadline_ = now + opt_.kill_wait;
        changed = true;
    }

    if (run.escalated_ && now >= run.kill_deadline_) {
        Drain(true);
        std::vector<ProgressSample> tail;
        run.parser_.Flush(tail);
        Apply(tail);

        run.failure_reason_ = "process did not exit after SIGKILL";
        SetTerminal(OperationState::Failed);
        log_.Write(LogLevel::Error, "%s cancel failed: process still alive %lld ms after SIGKILL",
                   ToString(run.Kind()), Millis(opt_.kill_wait));
        return true;
    }
    return changed;
}

void OperationController::SetTerminal(OperationState state) {
    run_->state_ = state;
    run_->finished_at_ = std::chrono::steady_clock::now();
}

void OperationController::Finish() {
    OperationRun& run = *run_;

    // Everything the process wrote reaches the models before the end state.
    Drain(true);
    run.child_.ReapGroupStragglers(kStragglerWait);
    Drain(true);
    run.child_.CloseStatus();

    std::vector<ProgressSample> tail;
    run.parser_.Flush(tail);
    Apply(tail);

    const ExitStatus& ex = run.child_.Status();
    run.exit_code_ = ex.code;

    if (run.state_ == OperationState::Cancelling) {
        if (StoppedByCancel(ex)) {
            run.cancelled_ = true;
            SetTerminal(OperationState::Completed);
            log_.Write(LogLevel::Info, "Operation cancelled after %llu of %llu bytes.",
                       static_cast<unsigned long long>(run.stats_.BytesTransferred()),
                       static_cast<unsigned long long>(run.request_.total_bytes));
        } else {
            run.failure_reason_ = "exited with code " + std::to_string(ex.code) + " while cancelling";
            SetTerminal(OperationState::Failed);
            log_.Write(LogLevel::Error, "Operation failed with code %d.", ex.code);
        }
        return;
    }

    if (ex.exited && ex.code == 0) {
        SetTerminal(OperationState::Completed);
        log_.Write(LogLevel::Info, "Operation completed successfully.");
        return;
    }

    if (ex.exited && ex.code == 1 && run.parser_.TargetFull()) {
        SetTerminal(OperationState::Completed);
        log_.Write(LogLevel::Info, "Operation completed successfully (target device filled).");
        return;
    }

    run.failure_reason_ = ex.Signaled() ? "killed by signal " + std::to_string(ex.signal)
                                        : "exit code " + std::to_string(ex.code);
    SetTerminal(OperationState::Failed);
    if (run.last_error_offset_) {
        log_.Write(LogLevel::Error, "Operation failed with code %d (last error near byte %llu).",
                   ex.code, static_cast<unsigned long long>(*run.last_error_offset_));
    } else {
        log_.Write(LogLevel::Error, "Operation failed with code %d.", ex.code);
    }
}

} // namespace ddi
