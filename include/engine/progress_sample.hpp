#pragma once

#include <cstdint>
#include <optional>

namespace ddi {

struct ProgressSample {
    std::uint64_t bytes_transferred = 0;
    double elapsed_seconds = 0.0;
    std::optional<std::uint64_t> records_in;
    std::optional<std::uint64_t> records_out;
    std::optional<std::uint64_t> error_at_offset;
};

} // namespace ddi
