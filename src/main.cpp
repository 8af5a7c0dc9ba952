#include "engine/operation.hpp"
#include "engine/operation_controller.hpp"
#include "system/signals.hpp"
#include "ui/progress_session.hpp"
#include "ui/progress_view.hpp"
#include "ui/terminal.hpp"
#include "util/config.hpp"
#include "util/format.hpp"
#include "util/log_sink.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/ddi/ddi.json";

constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s --kind <backup|restore|clone|wipe> --total-bytes <N> [options] (--shell <CMD> | -- <ARGV...>)\n"
        "\n"
        "Options:\n"
        "  -k, --kind           Operation label\n"
        "  -t, --total-bytes    Bytes the dd stage will transfer (device or image size)\n"
        "  -b, --block-size     dd block size, e.g. 4K, 64K, 1M (default 64K)\n"
        "  -s, --source         Source label shown in the header\n"
        "  -d, --dest           Destination label shown in the header\n"
        "  -v, --view           Initial view: progress | blockmap\n"
        "  -c, --config         JSON config file (default %s)\n"
        "  -l, --log-file       Log file (overrides LogFile)\n"
        "  -x, --shell          Run CMD with /bin/sh -c (pipelines)\n"
        "  -h, --help           Show this help\n"
        "\n"
        "Keys: v toggle view, q/Esc cancel, arrows/PgUp/PgDn/Home/End scroll log\n"
        "Exit codes: 0 completed, 1 failed, 2 usage, 130 cancelled\n",
        argv, kDefaultConfigPath);
}

std::optional<std::uint64_t> ParseU64(const char *s) {
    if (!s || *s == '\0' || *s == '-')
        return std::nullopt;
    errno = 0;
    char *end = nullptr;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return std::nullopt;
    return static_cast<std::uint64_t>(v);
}

int ExitCodeFor(const ddi::OperationRun &run) {
    if (run.State() != ddi::OperationState::Completed)
        return kExitFailed;
    return run.Cancelled() ? kExitCancelled : kExitCompleted;
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path = kDefaultConfigPath;
    const char *kind_arg = nullptr;
    const char *total_arg = nullptr;
    const char *block_arg = nullptr;
    const char *view_arg = nullptr;
    const char *log_file_arg = nullptr;
    const char *shell_cmd = nullptr;

    ddi::OperationRequest req{};

    static option long_opts[] = {
        {"kind", required_argument, nullptr, 'k'},
        {"total-bytes", required_argument, nullptr, 't'},
        {"block-size", required_argument, nullptr, 'b'},
        {"source", required_argument, nullptr, 's'},
        {"dest", required_argument, nullptr, 'd'},
        {"view", required_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"log-file", required_argument, nullptr, 'l'},
        {"shell", required_argument, nullptr, 'x'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "+hk:t:b:s:d:v:c:l:x:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'k':
                kind_arg = optarg;
                break;
            case 't':
                total_arg = optarg;
                break;
            case 'b':
                block_arg = optarg;
                break;
            case 's':
                req.source_label = optarg;
                break;
            case 'd':
                req.dest_label = optarg;
                break;
            case 'v':
                view_arg = optarg;
                break;
            case 'c':
                config_path = optarg;
                break;
            case 'l':
                log_file_arg = optarg;
                break;
            case 'x':
                shell_cmd = optarg;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (!kind_arg || !total_arg) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    auto kind = ddi::ParseOperationKind(kind_arg);
    if (!kind) {
        std::fprintf(stderr, "Invalid --kind: %s\n", kind_arg);
        return kExitUsage;
    }
    req.kind = *kind;

    auto total = ParseU64(total_arg);
    if (!total || *total == 0) {
        std::fprintf(stderr, "Invalid --total-bytes: %s\n", total_arg);
        return kExitUsage;
    }
    req.total_bytes = *total;

    if (shell_cmd && optind < argc) {
        std::fprintf(stderr, "--shell and a command line are mutually exclusive\n");
        return kExitUsage;
    }
    if (shell_cmd) {
        req.argv = {"/bin/sh", "-c", shell_cmd};
    } else {
        for (int i = optind; i < argc; ++i)
            req.argv.emplace_back(argv[i]);
    }
    if (req.argv.empty()) {
        std::fprintf(stderr, "No command given\n");
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    ddi::EngineConfig cfg;
    if (auto r = ddi::EngineConfig::LoadFromFile(config_path, cfg); !r.ok) {
        if (r.err != ENOENT) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitFailed;
        }
        std::fprintf(stderr, "WARN: %s (using defaults)\n", r.msg.c_str());
    }

    if (block_arg) {
        auto bs = ddi::ParseBlockSize(block_arg);
        if (!bs) {
            std::fprintf(stderr, "Invalid --block-size: %s\n", block_arg);
            return kExitUsage;
        }
        cfg.block_size = *bs;
    }
    if (view_arg) {
        auto mode = ddi::ParseViewMode(view_arg);
        if (!mode) {
            std::fprintf(stderr, "Invalid --view: %s\n", view_arg);
            return kExitUsage;
        }
        cfg.default_view = *mode;
    }
    if (log_file_arg)
        cfg.log_file = log_file_arg;

    req.block_size = cfg.block_size;
    req.initial_view = cfg.default_view;

    auto &logger = ddi::Logger::Instance();
    logger.SetLevel(cfg.log_level);
    if (!cfg.log_file.empty()) {
        if (auto r = logger.OpenFile(cfg.log_file); !r.ok)
            LogWarn("%s", r.msg.c_str());
    }

    if (auto r = ddi::BecomeChildSubreaper(); !r.ok)
        LogWarn("%s", r.msg.c_str());
    ddi::InstallSignalHandlers();

    ddi::LogSink sink(static_cast<std::size_t>(cfg.log_retention));

    ddi::OperationController::Options copt;
    copt.cancel_grace = std::chrono::milliseconds(cfg.cancel_grace_ms);
    copt.kill_wait = std::chrono::milliseconds(cfg.kill_wait_ms);
    copt.rate_window.seconds = cfg.rate_window_seconds;
    copt.rate_window.samples = static_cast<std::size_t>(cfg.rate_window_samples);
    ddi::OperationController ctrl(sink, copt);

    const auto size = ddi::QueryTerminalSize(STDOUT_FILENO);
    const auto cells = ddi::CellCountForWidth(size.width, static_cast<std::uint32_t>(cfg.map_rows));

    LogInfo("%s: %s -> %s, %s, bs=%s",
            ddi::ToString(req.kind),
            req.source_label.empty() ? "-" : req.source_label.c_str(),
            req.dest_label.empty() ? "-" : req.dest_label.c_str(),
            ddi::FormatBytes(static_cast<double>(req.total_bytes)).c_str(),
            ddi::FormatBlockSize(req.block_size).c_str());

    if (auto r = ctrl.Start(req, cells); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitFailed;
    }

    ddi::ProgressSession::Options sopt;
    sopt.render_interval = std::chrono::milliseconds(cfg.render_interval_ms);
    sopt.color = cfg.color && ddi::IsTty(STDOUT_FILENO);
    ddi::ProgressSession session(ctrl, sink, sopt);

    if (auto r = session.Run(); !r.ok) {
        LogError("display: %s", r.msg.c_str());
        if (ctrl.HasActiveRun()) {
            ctrl.RequestCancel();
            while (ctrl.HasActiveRun()) {
                (void)ctrl.Pump();
                ::usleep(20 * 1000);
            }
        }
    }

    const ddi::OperationRun *run = ctrl.Run();
    const int code = ExitCodeFor(*run);
    std::fprintf(stderr, "%s\n", ddi::ResultMessage(*run).c_str());
    logger.CloseFile();
    return code;
}
