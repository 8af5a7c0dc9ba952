#include "engine/run_stats.hpp"

#include <algorithm>

namespace ddi {

RunStats::RunStats() : RunStats(0) {}

RunStats::RunStats(std::uint64_t total_bytes) : RunStats(total_bytes, Window{}) {}

RunStats::RunStats(std::uint64_t total_bytes, Window window) : policy_(window) {
    policy_.samples = std::max<std::size_t>(2, policy_.samples);
    Reset(total_bytes);
}

void RunStats::Reset(std::uint64_t total_bytes) {
    total_bytes_ = total_bytes;
    bytes_ = 0;
    last_elapsed_ = 0.0;
    error_count_ = 0;
    sample_count_ = 0;
    window_.clear();
    start_time_ = Clock::now();
}

void RunStats::Record(const ProgressSample& sample) {
    bytes_ = std::max(bytes_, sample.bytes_transferred);
    last_elapsed_ = std::max(last_elapsed_, sample.elapsed_seconds);
    ++sample_count_;

    window_.push_back(Point{sample.bytes_transferred, sample.elapsed_seconds});

    const double horizon = window_.back().elapsed - policy_.seconds;
    while (window_.size() > 2 &&
           (window_.size() > policy_.samples || window_.front().elapsed < horizon)) {
        window_.pop_front();
    }
}

double RunStats::Rate() const {
    if (window_.size() < 2)
        return 0.0;
    const Point& first = window_.front();
    const Point& last = window_.back();
    const double dt = last.elapsed - first.elapsed;
    if (dt <= 0 || last.bytes < first.bytes)
        return 0.0;
    return static_cast<double>(last.bytes - first.bytes) / dt;
}

double RunStats::Percent() const {
    if (total_bytes_ == 0)
        return 0.0;
    const double pct = static_cast<double>(bytes_) / static_cast<double>(total_bytes_) * 100.0;
    return std::clamp(pct, 0.0, 100.0);
}

std::optional<double> RunStats::Eta() const {
    const double rate = Rate();
    if (rate <= 0)
        return std::nullopt;
    const std::uint64_t remaining = bytes_ >= total_bytes_ ? 0 : total_bytes_ - bytes_;
    return static_cast<double>(remaining) / rate;
}

} // namespace ddi
