#include "util/log_sink.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>

namespace ddi {

LogSink::LogSink(std::size_t retention) : retention_(std::max<std::size_t>(1, retention)) {}

void LogSink::Append(LogLevel lvl, std::string message) {
    std::lock_guard<std::mutex> lk(mu_);
    // Mirrored under the lock so the file keeps the panel's order.
    Logger::Instance().Log(lvl, "%s", message.c_str());
    entries_.push_back(LogEntry{std::chrono::system_clock::now(), lvl, std::move(message)});
    while (entries_.size() > retention_) {
        entries_.pop_front();
    }
    ++sequence_;
}

void LogSink::Write(LogLevel lvl, const char* fmt, ...) {
    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    const int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (n < 0) {
        Append(lvl, fmt);
        return;
    }
    Append(lvl, std::string(buf));
}

std::vector<LogEntry> LogSink::Snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return {entries_.begin(), entries_.end()};
}

std::vector<LogEntry> LogSink::Tail(std::size_t count, std::size_t skip_newest) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (skip_newest >= entries_.size())
        return {};
    const std::size_t end = entries_.size() - skip_newest;
    const std::size_t begin = end > count ? end - count : 0;
    return {entries_.begin() + static_cast<std::ptrdiff_t>(begin),
            entries_.begin() + static_cast<std::ptrdiff_t>(end)};
}

std::size_t LogSink::Size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

std::uint64_t LogSink::Sequence() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sequence_;
}

std::string FormatLogEntry(const LogEntry& e) {
    const std::time_t t = std::chrono::system_clock::to_time_t(e.timestamp);
    std::tm tm{};
    char ts[16] = "--:--:--";
    if (localtime_r(&t, &tm) != nullptr) {
        std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm);
    }
    return std::string(ts) + " - " + ToString(e.level) + " - " + e.message;
}

} // namespace ddi
