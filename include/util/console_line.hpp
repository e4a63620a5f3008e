#pragma once

#include <mutex>

namespace xfer {

// stderr is shared between log lines and the in-place progress line.
std::mutex& ConsoleMutex();

// Callers must hold ConsoleMutex().
bool IsProgressLineActive();
void SetProgressLineActive(bool active);
void ClearProgressLine();

} // namespace xfer
