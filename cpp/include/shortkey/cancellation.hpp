#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

#include "shortkey/error.hpp"

namespace shortkey {

/**
 * Cooperative cancellation flag shared between a caller and an allocation.
 * Checked between attempts and while backing off, never inside a store
 * transaction.
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    void throw_if_cancelled(const std::string& context = "") const {
        if (cancelled()) throw CancelledError(context);
    }

    // Sleeps up to `delay`; returns false if cancelled first.
    template<typename Rep, typename Period>
    bool sleep_for(std::chrono::duration<Rep, Period> delay) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, delay, [this] { return cancelled(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace shortkey
