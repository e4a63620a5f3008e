#pragma once

#include "server/transfer_store.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace xfer {

// Background thread calling TransferStore::RemoveExpired right away and then
// once per interval until stopped.
class ExpirySweeper {
  public:
    ExpirySweeper(std::shared_ptr<TransferStore> store, std::chrono::milliseconds interval);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void Start();
    // Wakes the thread and joins it. Safe to call more than once.
    void Stop();

    // Completed passes, for tests.
    std::uint64_t Passes() const;

  private:
    void Loop();

    std::shared_ptr<TransferStore> store_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::uint64_t passes_ = 0;
    std::thread thread_;
};

} // namespace xfer
