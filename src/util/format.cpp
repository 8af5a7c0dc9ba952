#include "util/format.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>

namespace ddi {

std::string FormatBytes(double bytes) {
    if (!std::isfinite(bytes) || bytes < 0)
        return "N/A";
    if (bytes == 0)
        return "0.0 B";

    static constexpr std::array<const char*, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
    std::size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < kUnits.size()) {
        bytes /= 1024.0;
        ++unit;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %s", bytes, kUnits[unit]);
    return buf;
}

std::string FormatDuration(std::optional<double> seconds) {
    if (!seconds || !std::isfinite(*seconds) || *seconds < 0)
        return "??:??:??";

    // Clamped to 99999:59:59 so the cast stays defined.
    constexpr double kMaxSeconds = 99999.0 * 3600 + 59 * 60 + 59;
    const auto total = static_cast<unsigned long long>(std::min(*seconds, kMaxSeconds));
    const unsigned long long h = total / 3600;
    const unsigned long long m = (total % 3600) / 60;
    const unsigned long long s = total % 60;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu", h, m, s);
    return buf;
}

std::optional<std::uint64_t> ParseBlockSize(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    if (s.empty())
        return std::nullopt;

    std::uint64_t count = 0;
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(begin, end, count);
    if (ec != std::errc{} || ptr == begin || count == 0)
        return std::nullopt;

    std::string suffix;
    for (const char* p = ptr; p != end; ++p) {
        suffix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
    }

    std::uint64_t mult = 1;
    if (suffix.empty() || suffix == "B") {
        mult = 1;
    } else if (suffix == "K" || suffix == "KB" || suffix == "KIB") {
        mult = 1024ULL;
    } else if (suffix == "M" || suffix == "MB" || suffix == "MIB") {
        mult = 1024ULL * 1024;
    } else if (suffix == "G" || suffix == "GB" || suffix == "GIB") {
        mult = 1024ULL * 1024 * 1024;
    } else {
        return std::nullopt;
    }

    if (count > std::numeric_limits<std::uint64_t>::max() / mult)
        return std::nullopt;
    return count * mult;
}

std::string FormatBlockSize(std::uint64_t bytes) {
    constexpr std::uint64_t kK = 1024ULL;
    constexpr std::uint64_t kM = kK * 1024;
    constexpr std::uint64_t kG = kM * 1024;

    if (bytes >= kG && bytes % kG == 0) return std::to_string(bytes / kG) + "G";
    if (bytes >= kM && bytes % kM == 0) return std::to_string(bytes / kM) + "M";
    if (bytes >= kK && bytes % kK == 0) return std::to_string(bytes / kK) + "K";
    return std::to_string(bytes);
}

} // namespace ddi
