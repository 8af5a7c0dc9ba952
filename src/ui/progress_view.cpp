#include "ui/progress_view.hpp"

#include "util/format.hpp"

#include <algorithm>
#include <cstdio>

namespace ddi {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan = "\033[36m";

constexpr const char* kGlyphPending = "·";
constexpr const char* kGlyphWriting = "▒";
constexpr const char* kGlyphComplete = "█";
constexpr const char* kGlyphError = "X";

constexpr int kMinMapWidth = 40;
constexpr int kMaxMapWidth = 120;
constexpr int kMapMargin = 8;
constexpr std::size_t kDiagnosticLines = 3;

class Painter {
  public:
    explicit Painter(bool color) : color_(color) {}

    std::string Wrap(const char* code, const std::string& text) const {
        if (!color_)
            return text;
        return std::string(code) + text + kReset;
    }

  private:
    bool color_;
};

int MapWidth(int width) {
    return std::clamp(width - kMapMargin, kMinMapWidth, kMaxMapWidth);
}

const char* Glyph(CellState s) {
    switch (s) {
    case CellState::Pending: return kGlyphPending;
    case CellState::Writing: return kGlyphWriting;
    case CellState::Complete: return kGlyphComplete;
    case CellState::Error: return kGlyphError;
    }
    return kGlyphPending;
}

const char* CellColor(CellState s) {
    switch (s) {
    case CellState::Writing: return kYellow;
    case CellState::Complete: return kGreen;
    case CellState::Error: return kRed;
    default: return nullptr;
    }
}

std::string Header(const OperationRun& run) {
    const auto& req = run.Request();
    std::string line = std::string(ToString(run.Kind())) + ":";
    if (!req.source_label.empty())
        line += " From " + req.source_label;
    if (!req.dest_label.empty())
        line += " To " + req.dest_label;
    return line;
}

std::string Summary(const OperationRun& run) {
    char buf[256];
    std::snprintf(buf, sizeof(buf), "Progress: %.1f%% | Speed: %s/s | ETA: %s | Errors: %llu",
                  run.Percent(),
                  FormatBytes(run.Rate()).c_str(),
                  FormatDuration(run.Eta()).c_str(),
                  static_cast<unsigned long long>(run.ErrorCount()));
    return buf;
}

std::string Transferred(const OperationRun& run, std::chrono::steady_clock::time_point now) {
    char buf[256];
    std::snprintf(buf, sizeof(buf), "Transferred: %s / %s | Elapsed: %s",
                  FormatBytes(static_cast<double>(run.BytesTransferred())).c_str(),
                  FormatBytes(static_cast<double>(run.Request().total_bytes)).c_str(),
                  FormatDuration(run.ElapsedSeconds(now)).c_str());
    return buf;
}

std::string StateLine(const OperationRun& run, const Painter& p) {
    switch (run.State()) {
    case OperationState::Starting:
        return "Starting...";
    case OperationState::Running:
        return p.Wrap(kCyan, "Running");
    case OperationState::Cancelling:
        return p.Wrap(kYellow, "Cancelling...");
    case OperationState::Completed:
        return p.Wrap(run.Cancelled() ? kYellow : kGreen, ResultMessage(run));
    case OperationState::Failed:
        return p.Wrap(kRed, ResultMessage(run));
    }
    return {};
}

std::string Bar(const OperationRun& run, int width, const Painter& p) {
    const int inner = MapWidth(width);
    const double pct = std::clamp(run.Percent(), 0.0, 100.0);
    const int filled = static_cast<int>(pct / 100.0 * inner);
    std::string done;
    std::string rest;
    for (int i = 0; i < filled; ++i)
        done += kGlyphComplete;
    for (int i = filled; i < inner; ++i)
        rest += kGlyphPending;
    return "[" + p.Wrap(kGreen, done) + rest + "]";
}

void AppendMap(Frame& out, const OperationRun& run, int width, const Painter& p) {
    const auto& cells = run.BlockMap().Cells();
    const std::size_t per_row = static_cast<std::size_t>(MapWidth(width));
    for (std::size_t start = 0; start < cells.size(); start += per_row) {
        const std::size_t end = std::min(cells.size(), start + per_row);
        std::string row;
        for (std::size_t i = start; i < end; ++i) {
            const char* color = CellColor(cells[i]);
            row += color ? p.Wrap(color, Glyph(cells[i])) : std::string(Glyph(cells[i]));
        }
        out.push_back(std::move(row));
    }
    out.push_back(std::string(kGlyphPending) + " pending  " + kGlyphWriting + " writing  " +
                  kGlyphComplete + " complete  " + kGlyphError + " error");
}

// Keeps at most `width` UTF-8 code points; never splits a sequence.
std::string Truncate(std::string s, int width) {
    if (width <= 0)
        return s;
    int points = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80)
            continue;
        if (++points > width) {
            s.resize(i);
            break;
        }
    }
    return s;
}

} // namespace

std::string ResultMessage(const OperationRun& run) {
    switch (run.State()) {
    case OperationState::Completed:
        return run.Cancelled() ? "Operation cancelled." : "Operation completed successfully.";
    case OperationState::Failed:
        if (run.ExitCode())
            return "Operation failed with code " + std::to_string(*run.ExitCode()) + ".";
        return "Operation failed: " + run.FailureReason() + ".";
    default:
        return {};
    }
}

std::uint32_t CellCountForWidth(int width, std::uint32_t rows) {
    return static_cast<std::uint32_t>(MapWidth(width)) * std::max<std::uint32_t>(rows, 1);
}

std::string RenderPlainLine(const OperationRun& run, std::chrono::steady_clock::time_point now) {
    return "[" + std::string(ToString(run.State())) + "] " + Summary(run) + " | " + Transferred(run, now);
}

Frame Render(const ViewInput& in) {
    const OperationRun& run = in.run;
    const Painter p(in.color);
    Frame out;

    out.push_back(p.Wrap(kBold, Header(run)));
    out.emplace_back();

    if (run.View() == ViewMode::BlockMap) {
        AppendMap(out, run, in.width, p);
    } else {
        out.push_back(Bar(run, in.width, p));
    }
    out.push_back(Summary(run));
    out.push_back(Transferred(run, in.now));
    out.push_back(StateLine(run, p));

    if (run.State() == OperationState::Failed) {
        const auto diag = run.Diagnostics();
        const std::size_t from = diag.size() > kDiagnosticLines ? diag.size() - kDiagnosticLines : 0;
        for (std::size_t i = from; i < diag.size(); ++i)
            out.push_back(Truncate("  " + diag[i], in.width));
    }

    if (IsTerminal(run.State())) {
        out.push_back("Press any key to exit");
    } else {
        out.push_back("Press 'v' to toggle view, 'q' or Esc to cancel, arrows/PgUp/PgDn to scroll log");
    }

    char title[64];
    if (in.log_scroll > 0)
        std::snprintf(title, sizeof(title), "-- Log (%zu newer hidden) --", in.log_scroll);
    else
        std::snprintf(title, sizeof(title), "-- Log --");
    out.emplace_back();
    out.push_back(title);

    const int room = in.height - static_cast<int>(out.size());
    if (room > 0) {
        const std::size_t n = std::min(in.log.size(), static_cast<std::size_t>(room));
        for (std::size_t i = in.log.size() - n; i < in.log.size(); ++i) {
            const auto& e = in.log[i];
            std::string line = Truncate(FormatLogEntry(e), in.width);
            if (e.level == LogLevel::Error)
                line = p.Wrap(kRed, line);
            else if (e.level == LogLevel::Warn)
                line = p.Wrap(kYellow, line);
            out.push_back(std::move(line));
        }
    }
    return out;
}

} // namespace ddi
