#pragma once

#include "engine/operation_controller.hpp"
#include "util/log_sink.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ddi {

using Frame = std::vector<std::string>;

struct ViewInput {
    const OperationRun& run;
    // Oldest first, already offset by the scroll position.
    std::vector<LogEntry> log;
    int width = 80;
    int height = 24;
    // Entries hidden below the panel; 0 follows the newest entry.
    std::size_t log_scroll = 0;
    std::chrono::steady_clock::time_point now;
    bool color = true;
};

// Pure function of its input: neither the run nor the log is modified.
Frame Render(const ViewInput& in);

// One summary line for non-terminal output.
std::string RenderPlainLine(const OperationRun& run, std::chrono::steady_clock::time_point now);

// Terminal-state message ("Operation completed successfully." ...).
std::string ResultMessage(const OperationRun& run);

// Cells that fit `rows` map rows at this terminal width.
std::uint32_t CellCountForWidth(int width, std::uint32_t rows);

} // namespace ddi
