// signals.cpp - Signal handling and shared cancel flag for the client.

#include "system/signals.hpp"

#include <csignal>
#include <unistd.h>

namespace xfer {

std::atomic_bool g_cancel{false};

static void HandleSignal(int sig) {
    // A second interrupt while unwinding terminates at once.
    if (g_cancel.exchange(true, std::memory_order_relaxed)) {
        std::signal(sig, SIG_DFL);
        std::raise(sig);
    }
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace xfer
