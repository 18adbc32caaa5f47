#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// One-shot cancellation flag shared between a run's caller and its worker.
// Once set it stays set; waiters wake immediately.
class CancelToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const { return cancelled_.load(); }

    // Sleep until the deadline. Returns true if cancelled before it passed.
    bool wait_until(std::chrono::steady_clock::time_point deadline) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, deadline, [this] { return cancelled_.load(); });
    }

    bool wait_for(std::chrono::milliseconds duration) const {
        return wait_until(std::chrono::steady_clock::now() + duration);
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
};
