#pragma once

#include "util/result.hpp"

#include <atomic>

namespace ddi {

// Set by SIGINT/SIGTERM; the session turns it into a cancel request.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

// Orphaned pipeline stages (e.g. a compressor behind dd) are re-parented to
// this process, so they can be reaped before a run reports its end state.
Result BecomeChildSubreaper();

} // namespace ddi
