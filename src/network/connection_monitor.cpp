#include "connection_monitor.hpp"
#include <platform/platform.hpp>
#include <sync/sync_log.hpp>
#include <fmt/format.h>
#include <vector>

// ── Subscription ────────────────────────────────────────────

void ConnectionMonitor::Subscription::reset() {
    if (monitor_) {
        monitor_->unsubscribe(id_);
        monitor_ = nullptr;
    }
}

// ── Construction / Destruction ──────────────────────────────

ConnectionMonitor::ConnectionMonitor(ConnectionProbe& probe, std::chrono::milliseconds interval)
    : probe_(probe), interval_(interval) {}

ConnectionMonitor::~ConnectionMonitor() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

bool ConnectionMonitor::start() {
    if (running_) return true;
    running_ = true;
    thread_ = std::thread(&ConnectionMonitor::monitor_loop, this);
    sync_log(fmt::format("monitor: started, interval {} ms", interval_.count()));
    return true;
}

void ConnectionMonitor::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    sync_log("monitor: stopped");
}

// ── Subscribers ─────────────────────────────────────────────

ConnectionMonitor::Subscription ConnectionMonitor::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = next_id_++;
    listeners_[id] = std::move(listener);
    return Subscription(this, id);
}

void ConnectionMonitor::unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

std::optional<ConnectionStatus> ConnectionMonitor::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

void ConnectionMonitor::publish(const ConnectionStatus& status) {
    std::vector<Listener> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool changed = !latest_ ||
                       latest_->vpn_connected != status.vpn_connected ||
                       latest_->share_mounted != status.share_mounted;
        latest_ = status;
        if (!changed) return;
        for (const auto& [id, l] : listeners_) to_call.push_back(l);
    }

    sync_log(fmt::format("monitor: vpn={} share={}", status.vpn_connected, status.share_mounted));
    // Called without the lock so a listener may unsubscribe
    for (const auto& l : to_call) {
        if (l) l(status);
    }
}

ConnectionStatus ConnectionMonitor::check_now() {
    ConnectionStatus status;
    {
        std::lock_guard<std::mutex> lock(probe_mutex_);
        status = probe_.status();
    }
    publish(status);
    return status;
}

// ── Monitor loop ────────────────────────────────────────────

void ConnectionMonitor::monitor_loop() {
    while (running_) {
        check_now();

        // Sleep in short slices so stop() returns promptly
        auto deadline = std::chrono::steady_clock::now() + interval_;
        while (running_ && std::chrono::steady_clock::now() < deadline) {
            platform::sleep_ms(100);
        }
    }
}
