#pragma once

#include "xfer/progress.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>

namespace xfer {

// In-place progress line on stderr. OnProgress() only records the latest
// event; a ticker thread draws it, so the transfer loop never waits on the
// terminal.
class ConsoleProgress final : public IProgress {
  public:
    explicit ConsoleProgress(std::chrono::milliseconds tick = std::chrono::milliseconds(200));
    ~ConsoleProgress() override;

    ConsoleProgress(const ConsoleProgress&) = delete;
    ConsoleProgress& operator=(const ConsoleProgress&) = delete;

    void OnProgress(const ProgressEvent& e) override;

    // Draws the final state, ends the line and stops the ticker.
    void Finish();

  private:
    struct Snapshot {
        std::string stage;
        std::uint64_t done = 0;
        std::uint64_t total = 0;
        std::chrono::steady_clock::time_point started;
    };

    void Loop();
    void Draw(const Snapshot& s, bool final_line);

    std::chrono::milliseconds tick_;

    std::mutex mu_;
    std::condition_variable cv_;
    Snapshot latest_;
    bool dirty_ = false;
    bool stop_ = false;
    std::thread thread_;
};

} // namespace xfer
