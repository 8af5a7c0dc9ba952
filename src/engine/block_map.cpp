#include "engine/block_map.hpp"

#include <algorithm>

namespace ddi {

BlockMapModel::BlockMapModel(std::uint64_t total_bytes, std::uint32_t cell_count) {
    Initialize(total_bytes, cell_count);
}

void BlockMapModel::Initialize(std::uint64_t total_bytes, std::uint32_t cell_count) {
    if (cell_count == 0)
        cell_count = 1;

    total_bytes_ = total_bytes;
    bytes_per_cell_ = std::max<std::uint64_t>(
        1, total_bytes / cell_count + (total_bytes % cell_count != 0 ? 1 : 0));
    high_water_ = 0;
    error_count_ = 0;
    cells_.assign(cell_count, CellState::Pending);
}

std::uint32_t BlockMapModel::CellIndex(std::uint64_t offset) const {
    const std::uint64_t idx = offset / bytes_per_cell_;
    const std::uint64_t last = cells_.empty() ? 0 : cells_.size() - 1;
    return static_cast<std::uint32_t>(std::min(idx, last));
}

void BlockMapModel::ApplyProgress(std::uint64_t bytes_transferred) {
    if (cells_.empty() || bytes_transferred < high_water_)
        return;
    high_water_ = bytes_transferred;

    const bool done = total_bytes_ > 0 && bytes_transferred >= total_bytes_;
    const std::uint32_t current = done ? CellCount() : CellIndex(bytes_transferred);

    for (std::uint32_t i = 0; i < current; ++i) {
        if (cells_[i] != CellState::Error)
            cells_[i] = CellState::Complete;
    }
    if (!done && cells_[current] != CellState::Error)
        cells_[current] = CellState::Writing;
}

void BlockMapModel::ApplyError(std::uint64_t offset) {
    if (cells_.empty())
        return;
    cells_[CellIndex(offset)] = CellState::Error;
    ++error_count_;
}

std::optional<std::uint32_t> BlockMapModel::WritingCell() const {
    auto it = std::find(cells_.begin(), cells_.end(), CellState::Writing);
    if (it == cells_.end())
        return std::nullopt;
    return static_cast<std::uint32_t>(it - cells_.begin());
}

std::uint32_t BlockMapModel::Count(CellState state) const {
    return static_cast<std::uint32_t>(std::count(cells_.begin(), cells_.end(), state));
}

} // namespace ddi
