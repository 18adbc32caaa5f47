#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

// ── Events ──────────────────────────────────────────────────

enum class EventKind {
    Status,     // informational line
    Progress,   // percent update
    Error,      // something failed (possibly soft)
    Complete,   // one step finished successfully
    Done,       // terminal event of a run, always last
};

const char* to_string(EventKind kind);

struct SyncEvent {
    EventKind kind = EventKind::Status;
    std::string message;
    int percent = -1;   // -1 when not applicable

    static SyncEvent status(std::string msg) { return {EventKind::Status, std::move(msg), -1}; }
    static SyncEvent error(std::string msg) { return {EventKind::Error, std::move(msg), -1}; }
    static SyncEvent progress(int pct, std::string msg = "") {
        return {EventKind::Progress, std::move(msg), pct};
    }
};

using EventCallback = std::function<void(const SyncEvent&)>;

// ── Event queue ─────────────────────────────────────────────

// Multi-producer queue the caller drains while a run is in flight.
class EventQueue {
public:
    void push(SyncEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    // Pop the oldest event, waiting up to timeout_ms. False on timeout.
    bool pop(SyncEvent& out, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                          [this] { return !events_.empty(); })) {
            return false;
        }
        out = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SyncEvent> events_;
};
