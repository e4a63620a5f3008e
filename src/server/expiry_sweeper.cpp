#include "server/expiry_sweeper.hpp"

#include "util/logger.hpp"

#include <exception>

namespace xfer {

ExpirySweeper::ExpirySweeper(std::shared_ptr<TransferStore> store, std::chrono::milliseconds interval)
    : store_(std::move(store)), interval_(interval) {}

ExpirySweeper::~ExpirySweeper() { Stop(); }

void ExpirySweeper::Start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (thread_.joinable()) return;
    stop_ = false;
    thread_ = std::thread(&ExpirySweeper::Loop, this);
    LogInfo("Expiry sweep every %lld ms", static_cast<long long>(interval_.count()));
}

void ExpirySweeper::Stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

std::uint64_t ExpirySweeper::Passes() const {
    std::lock_guard<std::mutex> lk(mu_);
    return passes_;
}

void ExpirySweeper::Loop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_) {
        lk.unlock();
        try {
            store_->RemoveExpired();
        } catch (const std::exception& e) {
            LogError("Expiry sweep failed: %s", e.what());
        }
        lk.lock();
        ++passes_;
        cv_.wait_for(lk, interval_, [this] { return stop_; });
    }
}

} // namespace xfer
