#include "engine/progress_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace ddi {

namespace {

constexpr int kMaxLoggedLine = 200;

constexpr std::array<std::string_view, 4> kErrorMarkers{
    "error reading",
    "error writing",
    "input/output error",
    "cannot allocate memory",
};

constexpr std::string_view kTargetFullMarker = "no space left on device";

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (IsSpace(s.front()) || s.front() == '\0')) s.remove_prefix(1);
    while (!s.empty() && (IsSpace(s.back()) || s.back() == '\0')) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> Tokenize(std::string_view s) {
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && IsSpace(s[i])) ++i;
        const std::size_t start = i;
        while (i < s.size() && !IsSpace(s[i])) ++i;
        if (i > start) out.push_back(s.substr(start, i - start));
    }
    return out;
}

// "(1.1" -> "1.1", "s," -> "s", "GiB)" -> "GiB"
std::string_view StripPunct(std::string_view t) {
    while (!t.empty() && (t.front() == '(' || t.front() == '[')) t.remove_prefix(1);
    while (!t.empty() && (t.back() == ',' || t.back() == ')' || t.back() == ';' ||
                          t.back() == ':' || t.back() == ']')) {
        t.remove_suffix(1);
    }
    return t;
}

std::string Lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool WordIs(std::string_view token, std::initializer_list<std::string_view> words) {
    const std::string w = Lower(StripPunct(token));
    return std::find(words.begin(), words.end(), w) != words.end();
}

bool ParseU64(std::string_view s, std::uint64_t& out) {
    if (s.empty() || !IsDigit(s.front()))
        return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// Accepts '.' or ',' as the decimal separator.
bool ParseSeconds(std::string_view s, double& out) {
    std::string text(s);
    std::replace(text.begin(), text.end(), ',', '.');
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size() && std::isfinite(out) && out >= 0;
}

} // namespace

ProgressParser::ProgressParser(LogSink& log, std::uint64_t block_size)
    : log_(log), block_size_(block_size == 0 ? 512 : block_size) {}

void ProgressParser::Feed(std::string_view chunk, std::vector<ProgressSample>& out) {
    pending_.append(chunk);

    std::size_t start = 0;
    for (std::size_t i = 0; i < pending_.size(); ++i) {
        const char c = pending_[i];
        if (c != '\n' && c != '\r')
            continue;
        if (auto s = ParseLine(std::string_view(pending_).substr(start, i - start)))
            out.push_back(*s);
        start = i + 1;
    }
    pending_.erase(0, start);

    if (pending_.size() > kMaxPendingBytes) {
        Anomaly("unterminated line exceeds buffer", pending_);
        pending_.clear();
    }
}

void ProgressParser::Flush(std::vector<ProgressSample>& out) {
    if (pending_.empty())
        return;
    const std::string tail = std::move(pending_);
    pending_.clear();
    if (auto s = ParseLine(tail))
        out.push_back(*s);
}

std::optional<ProgressSample> ProgressParser::ParseLine(std::string_view raw) {
    const std::string_view line = Trim(raw);
    if (line.empty())
        return std::nullopt;

    const std::string lower = Lower(line);
    if (lower.find(kTargetFullMarker) != std::string::npos) {
        target_full_ = true;
        Remember(line);
        log_.Write(LogLevel::Info, "%.*s", kMaxLoggedLine, std::string(line).c_str());
        return std::nullopt;
    }
    for (auto marker : kErrorMarkers) {
        if (lower.find(marker) != std::string::npos)
            return ParseErrorLine(line);
    }

    const auto tokens = Tokenize(line);
    if (tokens.size() >= 2 && (IsDigit(tokens[0].front()) || tokens[0].front() == '-')) {
        if (WordIs(tokens[1], {"bytes", "byte"}))
            return ParseBytesLine(tokens, line);
        if (tokens.size() >= 3 && WordIs(tokens[1], {"records", "record"}) &&
            WordIs(tokens[2], {"in", "out"})) {
            return ParseRecordsLine(tokens, line);
        }
    }

    Remember(line);
    log_.Write(LogLevel::Info, "%.*s", kMaxLoggedLine, std::string(line).c_str());
    return std::nullopt;
}

std::optional<ProgressSample> ProgressParser::ParseBytesLine(
    const std::vector<std::string_view>& tokens, std::string_view line) {
    std::uint64_t bytes = 0;
    if (!ParseU64(tokens[0], bytes)) {
        Anomaly("bad byte count", line);
        return std::nullopt;
    }

    std::optional<double> elapsed;
    for (std::size_t i = 2; i < tokens.size(); ++i) {
        if (!WordIs(tokens[i], {"s", "sec", "secs", "seconds"}))
            continue;
        const std::string_view num = StripPunct(tokens[i - 1]);
        if (num.empty() || !IsDigit(num.front()))
            continue;
        double v = 0;
        if (!ParseSeconds(num, v)) {
            Anomaly("bad elapsed time", line);
            return std::nullopt;
        }
        elapsed = v;
        break;
    }

    if (bytes < last_bytes_) {
        Anomaly("byte count went backwards", line);
        return std::nullopt;
    }
    if (elapsed && *elapsed < last_elapsed_) {
        Anomaly("elapsed time went backwards", line);
        return std::nullopt;
    }

    return Accept(bytes, elapsed.value_or(last_elapsed_));
}

std::optional<ProgressSample> ProgressParser::ParseRecordsLine(
    const std::vector<std::string_view>& tokens, std::string_view line) {
    const std::string_view field = tokens[0];
    const auto plus = field.find('+');
    std::uint64_t full = 0;
    std::uint64_t partial = 0;
    if (plus == std::string_view::npos || !ParseU64(field.substr(0, plus), full) ||
        !ParseU64(field.substr(plus + 1), partial) ||
        full > std::numeric_limits<std::uint64_t>::max() - partial) {
        Anomaly("bad record count", line);
        return std::nullopt;
    }

    if (WordIs(tokens[2], {"in"})) {
        records_in_ = full + partial;
        return std::nullopt;
    }

    if (full > std::numeric_limits<std::uint64_t>::max() / block_size_) {
        Anomaly("record count out of range", line);
        return std::nullopt;
    }

    // Partial records are shorter than a block, so whole records give a
    // lower bound that never overtakes a byte count already reported.
    ProgressSample s = Accept(std::max(last_bytes_, full * block_size_), last_elapsed_);
    s.records_in = records_in_;
    s.records_out = full + partial;
    return s;
}

std::optional<ProgressSample> ProgressParser::ParseErrorLine(std::string_view line) {
    Remember(line);

    std::optional<std::uint64_t> offset;
    const auto tokens = Tokenize(line);
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (!WordIs(tokens[i], {"offset", "byte"}))
            continue;
        std::uint64_t v = 0;
        if (ParseU64(StripPunct(tokens[i + 1]), v)) {
            offset = v;
            break;
        }
    }

    ProgressSample s;
    s.bytes_transferred = last_bytes_;
    s.elapsed_seconds = last_elapsed_;
    s.error_at_offset = offset.value_or(last_bytes_);

    log_.Write(LogLevel::Warn, "Transfer error near byte %llu: %.*s",
               static_cast<unsigned long long>(*s.error_at_offset), kMaxLoggedLine,
               std::string(line).c_str());
    return s;
}

void ProgressParser::Anomaly(std::string_view reason, std::string_view line) {
    ++anomalies_;
    log_.Write(LogLevel::Warn, "Ignoring status line (%.*s): %.*s",
               static_cast<int>(reason.size()), reason.data(),
               kMaxLoggedLine, std::string(line).c_str());
}

void ProgressParser::Remember(std::string_view line) {
    diagnostics_.emplace_back(line);
    while (diagnostics_.size() > kMaxDiagnostics) diagnostics_.pop_front();
}

ProgressSample ProgressParser::Accept(std::uint64_t bytes, double elapsed) {
    last_bytes_ = bytes;
    last_elapsed_ = elapsed;

    ProgressSample s;
    s.bytes_transferred = bytes;
    s.elapsed_seconds = elapsed;
    return s;
}

} // namespace ddi
