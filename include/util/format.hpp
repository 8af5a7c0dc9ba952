#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ddi {

// "0.0 B", "512.00 B", "1.50 KiB" ... "TiB". Negative input renders "N/A".
std::string FormatBytes(double bytes);

// "HH:MM:SS"; unknown or negative renders "??:??:??".
std::string FormatDuration(std::optional<double> seconds);

// Decimal count with an optional K/M/G binary multiplier ("512", "4K", "64K",
// "1M", "1MiB"). Zero and overflow are rejected.
std::optional<std::uint64_t> ParseBlockSize(std::string_view s);

// Inverse of ParseBlockSize for exact multiples: 65536 -> "64K".
std::string FormatBlockSize(std::uint64_t bytes);

} // namespace ddi
