#include <gtest/gtest.h>
#include <network/connection_monitor.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include "fakes.hpp"

using namespace std::chrono_literals;

TEST(ConnectionMonitor, FirstCheckPublishes) {
    FakeProbe probe;
    ConnectionMonitor monitor(probe);
    int calls = 0;
    auto sub = monitor.subscribe([&](const ConnectionStatus&) { calls++; });

    EXPECT_FALSE(monitor.latest().has_value());
    monitor.check_now();
    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(monitor.latest().has_value());
    EXPECT_FALSE(monitor.latest()->vpn_connected);
}

TEST(ConnectionMonitor, PublishesOnlyOnChange) {
    FakeProbe probe;
    ConnectionMonitor monitor(probe);
    std::vector<ConnectionStatus> seen;
    auto sub = monitor.subscribe([&](const ConnectionStatus& s) { seen.push_back(s); });

    monitor.check_now();
    monitor.check_now();
    probe.vpn_up = true;
    monitor.check_now();
    monitor.check_now();
    probe.mounted = true;
    monitor.check_now();

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_TRUE(seen[1].vpn_connected);
    EXPECT_FALSE(seen[1].share_mounted);
    EXPECT_TRUE(seen[2].share_mounted);
}

TEST(ConnectionMonitor, SubscriptionResetStopsDelivery) {
    FakeProbe probe;
    ConnectionMonitor monitor(probe);
    int calls = 0;
    auto sub = monitor.subscribe([&](const ConnectionStatus&) { calls++; });

    monitor.check_now();
    sub.reset();
    EXPECT_FALSE(sub.active());
    probe.vpn_up = true;
    monitor.check_now();
    EXPECT_EQ(calls, 1);
}

TEST(ConnectionMonitor, SubscriptionUnsubscribesWhenDestroyed) {
    FakeProbe probe;
    ConnectionMonitor monitor(probe);
    int calls = 0;
    {
        auto sub = monitor.subscribe([&](const ConnectionStatus&) { calls++; });
        monitor.check_now();
    }
    probe.vpn_up = true;
    monitor.check_now();
    EXPECT_EQ(calls, 1);
}

TEST(ConnectionMonitor, MovedSubscriptionStaysActive) {
    FakeProbe probe;
    ConnectionMonitor monitor(probe);
    int calls = 0;
    ConnectionMonitor::Subscription kept;
    {
        auto sub = monitor.subscribe([&](const ConnectionStatus&) { calls++; });
        kept = std::move(sub);
        EXPECT_FALSE(sub.active());
    }
    EXPECT_TRUE(kept.active());
    monitor.check_now();
    EXPECT_EQ(calls, 1);
}

TEST(ConnectionMonitor, BackgroundThreadPolls) {
    FakeProbe probe;
    ConnectionMonitor monitor(probe, 20ms);
    std::atomic<int> calls{0};
    auto sub = monitor.subscribe([&](const ConnectionStatus&) { calls++; });

    EXPECT_TRUE(monitor.start());
    EXPECT_TRUE(monitor.running());
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (calls < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_GE(calls.load(), 1);

    probe.vpn_up = true;
    deadline = std::chrono::steady_clock::now() + 2s;
    while (calls < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(calls.load(), 2);

    monitor.stop();
    EXPECT_FALSE(monitor.running());
}
