#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace ddi {

enum class CellState : std::uint8_t {
    Pending,
    Writing,
    Complete,
    Error,
};

// Fixed grid of cells, each covering bytes_per_cell bytes of the target.
// Error cells are sticky for the lifetime of a run.
class BlockMapModel {
  public:
    BlockMapModel() = default;
    BlockMapModel(std::uint64_t total_bytes, std::uint32_t cell_count);

    void Initialize(std::uint64_t total_bytes, std::uint32_t cell_count);

    void ApplyProgress(std::uint64_t bytes_transferred);
    void ApplyError(std::uint64_t offset);

    std::uint32_t CellIndex(std::uint64_t offset) const;

    std::uint64_t TotalBytes() const { return total_bytes_; }
    std::uint32_t CellCount() const { return static_cast<std::uint32_t>(cells_.size()); }
    std::uint64_t BytesPerCell() const { return bytes_per_cell_; }
    std::uint64_t ErrorCount() const { return error_count_; }
    std::uint64_t HighWater() const { return high_water_; }

    CellState Cell(std::uint32_t index) const { return cells_.at(index); }
    const std::vector<CellState>& Cells() const { return cells_; }

    std::optional<std::uint32_t> WritingCell() const;
    std::uint32_t Count(CellState state) const;

  private:
    std::uint64_t total_bytes_ = 0;
    std::uint64_t bytes_per_cell_ = 1;
    std::uint64_t high_water_ = 0;
    std::uint64_t error_count_ = 0;
    std::vector<CellState> cells_;
};

} // namespace ddi
