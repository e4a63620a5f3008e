#include "client/console_progress.hpp"

#include "util/console_line.hpp"
#include "util/units.hpp"

#include <algorithm>

namespace xfer {

ConsoleProgress::ConsoleProgress(std::chrono::milliseconds tick) : tick_(tick) {
    thread_ = std::thread(&ConsoleProgress::Loop, this);
}

ConsoleProgress::~ConsoleProgress() { Finish(); }

void ConsoleProgress::OnProgress(const ProgressEvent& e) {
    std::lock_guard<std::mutex> lk(mu_);
    if (latest_.stage != e.stage) {
        // A new stage starts from zero; never go backwards within one.
        latest_.stage.assign(e.stage);
        latest_.done = 0;
        latest_.started = std::chrono::steady_clock::now();
    }
    latest_.done = std::max(latest_.done, e.done);
    latest_.total = e.total;
    dirty_ = true;
}

void ConsoleProgress::Finish() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_) return;
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void ConsoleProgress::Loop() {
    std::unique_lock<std::mutex> lk(mu_);
    Snapshot shown;
    bool have_shown = false;
    while (true) {
        cv_.wait_for(lk, tick_, [this] { return stop_; });
        const bool stopping = stop_;
        if (!dirty_ && !(stopping && have_shown)) {
            if (stopping) return;
            continue;
        }
        Snapshot s = latest_;
        dirty_ = false;
        lk.unlock();
        // Leave the finished stage's last state on its own line.
        if (have_shown && shown.stage != s.stage) Draw(shown, true);
        Draw(s, stopping);
        shown = s;
        have_shown = true;
        lk.lock();
        if (stopping) return;
    }
}

void ConsoleProgress::Draw(const Snapshot& s, bool final_line) {
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - s.started).count();
    const std::uint64_t rate = elapsed > 0.5 ? static_cast<std::uint64_t>(static_cast<double>(s.done) / elapsed) : 0;

    std::lock_guard<std::mutex> lk(ConsoleMutex());
    ClearProgressLine();
    if (s.total > 0) {
        const int pct = static_cast<int>(std::min<std::uint64_t>(100, s.done * 100ULL / s.total));
        std::fprintf(stderr, "\r[%s] %3d%% %s / %s", s.stage.c_str(), pct, FormatDecimalBytes(s.done).c_str(),
                     FormatDecimalBytes(s.total).c_str());
    } else {
        std::fprintf(stderr, "\r[%s] %s", s.stage.c_str(), FormatDecimalBytes(s.done).c_str());
    }
    if (rate > 0) std::fprintf(stderr, " @ %s/s", FormatDecimalBytes(rate).c_str());

    if (final_line) {
        std::fprintf(stderr, "\n");
        SetProgressLineActive(false);
    } else {
        SetProgressLineActive(true);
    }
    std::fflush(stderr);
}

} // namespace xfer
