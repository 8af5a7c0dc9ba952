#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ddi {

enum class OperationKind {
    Backup,
    Restore,
    Clone,
    Wipe,
};

enum class OperationState {
    Starting,
    Running,
    Cancelling,
    Completed,
    Failed,
};

enum class ViewMode {
    ProgressBar,
    BlockMap,
};

const char* ToString(OperationKind kind);
const char* ToString(OperationState state);
const char* ToString(ViewMode mode);

std::optional<OperationKind> ParseOperationKind(std::string_view s);
std::optional<ViewMode> ParseViewMode(std::string_view s);

inline bool IsTerminal(OperationState s) {
    return s == OperationState::Completed || s == OperationState::Failed;
}

inline ViewMode Toggled(ViewMode m) {
    return m == ViewMode::BlockMap ? ViewMode::ProgressBar : ViewMode::BlockMap;
}

// Everything the device/target resolver hands over to start a run. `argv`
// is the fully resolved command (block size, pipeline, source, destination).
struct OperationRequest {
    OperationKind kind = OperationKind::Backup;
    std::vector<std::string> argv;
    std::uint64_t total_bytes = 0;
    std::uint64_t block_size = 64 * 1024ULL;
    std::string source_label;
    std::string dest_label;
    ViewMode initial_view = ViewMode::ProgressBar;
};

} // namespace ddi
