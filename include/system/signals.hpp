#pragma once

#include <atomic>

namespace xfer {

// Set by SIGINT/SIGTERM once InstallSignalHandlers() ran.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }

} // namespace xfer
