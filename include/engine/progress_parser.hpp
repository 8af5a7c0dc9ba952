#pragma once

#include "engine/progress_sample.hpp"
#include "util/log_sink.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ddi {

// Turns the status text of dd (GNU, BSD and busybox flavours) into samples.
//
// Status lines end in '\n' or '\r' (status=progress redraws with '\r').
// Recognized:
//   "<N> bytes (...) copied, <T> s, <rate>"
//   "<N> bytes transferred in <T> secs (...)"
//   "<F>+<P> records in" / "<F>+<P> records out"
//   I/O error reports ("error reading", "Input/output error", ...)
// A line of a recognized shape with a bad number, or one that would move the
// byte count or the clock backwards, is an anomaly: it is logged and dropped.
class ProgressParser {
  public:
    static constexpr std::size_t kMaxPendingBytes = 64 * 1024;
    static constexpr std::size_t kMaxDiagnostics = 16;

    ProgressParser(LogSink& log, std::uint64_t block_size);

    // Buffers partial lines; complete lines are parsed and samples appended.
    void Feed(std::string_view chunk, std::vector<ProgressSample>& out);

    // Parses whatever is left after the stream closed.
    void Flush(std::vector<ProgressSample>& out);

    std::optional<ProgressSample> ParseLine(std::string_view line);

    std::uint64_t LastBytes() const { return last_bytes_; }
    std::uint64_t AnomalyCount() const { return anomalies_; }

    // dd reported ENOSPC: the destination is full.
    bool TargetFull() const { return target_full_; }

    // Most recent non-progress lines, oldest first.
    std::vector<std::string> Diagnostics() const { return {diagnostics_.begin(), diagnostics_.end()}; }

  private:
    std::optional<ProgressSample> ParseBytesLine(const std::vector<std::string_view>& tokens,
                                                 std::string_view line);
    std::optional<ProgressSample> ParseRecordsLine(const std::vector<std::string_view>& tokens,
                                                   std::string_view line);
    std::optional<ProgressSample> ParseErrorLine(std::string_view line);

    void Anomaly(std::string_view reason, std::string_view line);
    void Remember(std::string_view line);
    ProgressSample Accept(std::uint64_t bytes, double elapsed);

    LogSink& log_;
    std::uint64_t block_size_;
    std::string pending_;
    std::uint64_t last_bytes_ = 0;
    double last_elapsed_ = 0.0;
    std::optional<std::uint64_t> records_in_;
    std::uint64_t anomalies_ = 0;
    bool target_full_ = false;
    std::deque<std::string> diagnostics_;
};

} // namespace ddi
