#pragma once

#include "util/logger.hpp"

#include <chrono>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace ddi {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::Info;
    std::string message;
};

// Bounded, ordered message history shown in the log panel. Every entry is
// mirrored into Logger, so the log file keeps what the ring evicts.
class LogSink {
  public:
    static constexpr std::size_t kDefaultRetention = 500;

    explicit LogSink(std::size_t retention = kDefaultRetention);

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    void Append(LogLevel lvl, std::string message);
    void Write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    // Oldest first.
    std::vector<LogEntry> Snapshot() const;

    // Up to `count` entries ending `skip_newest` entries before the newest.
    std::vector<LogEntry> Tail(std::size_t count, std::size_t skip_newest = 0) const;

    std::size_t Size() const;
    std::size_t Retention() const { return retention_; }

    // Total number of appends; changes whenever the content changes.
    std::uint64_t Sequence() const;

  private:
    const std::size_t retention_;
    mutable std::mutex mu_;
    std::deque<LogEntry> entries_;
    std::uint64_t sequence_ = 0;
};

std::string FormatLogEntry(const LogEntry& e);

} // namespace ddi
