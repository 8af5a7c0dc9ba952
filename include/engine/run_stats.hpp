#pragma once

#include "engine/progress_sample.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace ddi {

// Rate, ETA and percentage over a sliding window of recent samples.
//
// Window policy: after each Record(), samples more than `window_seconds`
// (sample clock) behind the newest one are evicted, and the window never holds
// more than `window_samples`. The two newest samples are always kept so a rate
// exists even when status lines arrive less often than the window length.
class RunStats {
  public:
    struct Window {
        double seconds = 10.0;
        std::size_t samples = 64;
    };

    using Clock = std::chrono::steady_clock;

    RunStats();
    explicit RunStats(std::uint64_t total_bytes);
    RunStats(std::uint64_t total_bytes, Window window);

    void Reset(std::uint64_t total_bytes);

    void Record(const ProgressSample& sample);
    void RecordError() { ++error_count_; }

    // Bytes per second across the retained window; 0 if undefined.
    double Rate() const;
    // Clamped to [0, 100].
    double Percent() const;
    // Seconds remaining; nullopt when the rate is unknown.
    std::optional<double> Eta() const;

    std::uint64_t TotalBytes() const { return total_bytes_; }
    std::uint64_t BytesTransferred() const { return bytes_; }
    double LastElapsed() const { return last_elapsed_; }
    std::uint64_t ErrorCount() const { return error_count_; }
    std::size_t SampleCount() const { return sample_count_; }
    std::size_t WindowSize() const { return window_.size(); }
    const Window& WindowPolicy() const { return policy_; }
    Clock::time_point StartTime() const { return start_time_; }

  private:
    struct Point {
        std::uint64_t bytes;
        double elapsed;
    };

    Window policy_;
    std::uint64_t total_bytes_ = 0;
    std::uint64_t bytes_ = 0;
    double last_elapsed_ = 0.0;
    std::uint64_t error_count_ = 0;
    std::size_t sample_count_ = 0;
    std::deque<Point> window_;
    Clock::time_point start_time_;
};

} // namespace ddi
