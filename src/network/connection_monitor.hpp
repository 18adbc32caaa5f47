#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <core/constants.hpp>
#include "connection_probe.hpp"

// Polls a probe in the background and tells subscribers when the
// connection state changes. Owned by whoever constructs it; subscriptions
// must not outlive the monitor.
class ConnectionMonitor {
public:
    using Listener = std::function<void(const ConnectionStatus&)>;

    // Unsubscribes on destruction.
    class Subscription {
    public:
        Subscription() = default;
        Subscription(ConnectionMonitor* monitor, int id) : monitor_(monitor), id_(id) {}
        ~Subscription() { reset(); }

        Subscription(Subscription&& other) noexcept
            : monitor_(other.monitor_), id_(other.id_) {
            other.monitor_ = nullptr;
        }
        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                monitor_ = other.monitor_;
                id_ = other.id_;
                other.monitor_ = nullptr;
            }
            return *this;
        }
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();
        bool active() const { return monitor_ != nullptr; }

    private:
        ConnectionMonitor* monitor_ = nullptr;
        int id_ = -1;
    };

    explicit ConnectionMonitor(ConnectionProbe& probe,
                               std::chrono::milliseconds interval = std::chrono::seconds(MONITOR_INTERVAL_SECS));
    ~ConnectionMonitor();

    bool start();
    void stop();
    bool running() const { return running_; }

    // The listener runs on the monitor thread (or the caller of check_now).
    Subscription subscribe(Listener listener);

    // Probe immediately and notify subscribers if the state changed.
    ConnectionStatus check_now();

    std::optional<ConnectionStatus> latest() const;

private:
    void monitor_loop();
    void unsubscribe(int id);
    void publish(const ConnectionStatus& status);

    ConnectionProbe& probe_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex probe_mutex_;

    mutable std::mutex mutex_;
    std::map<int, Listener> listeners_;
    int next_id_ = 0;
    std::optional<ConnectionStatus> latest_;
};
