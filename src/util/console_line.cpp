#include "util/console_line.hpp"

#include <cstdio>

namespace xfer {

namespace {
bool g_progress_line_active = false;
} // namespace

std::mutex& ConsoleMutex() {
    static std::mutex mu;
    return mu;
}

bool IsProgressLineActive() { return g_progress_line_active; }

void SetProgressLineActive(bool active) { g_progress_line_active = active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\r\033[2K");
        std::fflush(stderr);
        g_progress_line_active = false;
    }
}

} // namespace xfer
