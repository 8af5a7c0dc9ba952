// signals.cpp - Signal handling and shared cancel flag.

#include "system/signals.hpp"

#include <csignal>
#include <sys/prctl.h>

namespace ddi {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGPIPE, SIG_IGN);
}

Result BecomeChildSubreaper() {
    if (::prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0)
        return Result::FromErrno("prctl(PR_SET_CHILD_SUBREAPER)");
    return Result::Ok();
}

} // namespace ddi
