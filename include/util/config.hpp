#pragma once

#include "engine/operation.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace ddi {

struct EngineConfig {
    std::string log_file = "ddi.log";
    LogLevel log_level = LogLevel::Info;
    std::uint64_t log_retention = 500;

    std::uint64_t cancel_grace_ms = 5000;
    std::uint64_t kill_wait_ms = 2000;
    std::uint64_t render_interval_ms = 250;

    double rate_window_seconds = 10.0;
    std::uint64_t rate_window_samples = 64;

    std::uint64_t block_size = 64 * 1024ULL;
    ViewMode default_view = ViewMode::ProgressBar;
    std::uint64_t map_rows = 1;
    bool color = true;

    // Keys absent from the file keep their current value in `out`.
    static Result LoadFromFile(const std::string& path, EngineConfig& out);
    static Result LoadFromString(const std::string& json_text, EngineConfig& out);
};

} // namespace ddi
