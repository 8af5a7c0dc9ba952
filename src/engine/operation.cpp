#include "engine/operation.hpp"

#include <cctype>
#include <string>

namespace ddi {

namespace {

std::string Lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

} // namespace

const char* ToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::Backup:  return "Backup";
        case OperationKind::Restore: return "Restore";
        case OperationKind::Clone:   return "Clone";
        case OperationKind::Wipe:    return "Wipe";
    }
    return "Operation";
}

const char* ToString(OperationState state) {
    switch (state) {
        case OperationState::Starting:   return "Starting";
        case OperationState::Running:    return "Running";
        case OperationState::Cancelling: return "Cancelling";
        case OperationState::Completed:  return "Completed";
        case OperationState::Failed:     return "Failed";
    }
    return "Unknown";
}

const char* ToString(ViewMode mode) {
    return mode == ViewMode::BlockMap ? "blockmap" : "progress";
}

std::optional<OperationKind> ParseOperationKind(std::string_view s) {
    const std::string v = Lower(s);
    if (v == "backup") return OperationKind::Backup;
    if (v == "restore") return OperationKind::Restore;
    if (v == "clone") return OperationKind::Clone;
    if (v == "wipe") return OperationKind::Wipe;
    return std::nullopt;
}

std::optional<ViewMode> ParseViewMode(std::string_view s) {
    const std::string v = Lower(s);
    if (v == "progress" || v == "bar" || v == "progressbar") return ViewMode::ProgressBar;
    if (v == "blockmap" || v == "map") return ViewMode::BlockMap;
    return std::nullopt;
}

} // namespace ddi
