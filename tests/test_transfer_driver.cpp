#include <gtest/gtest.h>
#include "fakes.hpp"
#include <algorithm>
#include <filesystem>
#include <thread>
#include <sync/transfer_driver.hpp>

namespace fs = std::filesystem;

class TransferDriverTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeProcessRunner runner;
    std::vector<SyncEvent> events;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("sharesync_driver_" + std::string(
                       ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "src");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    SyncSpec make_spec(int retries = 3) {
        SyncSpec spec;
        spec.source.path = (test_dir / "src").string();
        spec.destination.path = (test_dir / "dst").string();
        spec.retry_count = retries;
        return spec;
    }

    TransferDriver make_driver() {
        TransferDriver driver(runner, CopyTool::Rsync);
        driver.set_retry_backoff(std::chrono::milliseconds(0));
        return driver;
    }

    EventCallback collect() {
        return [this](const SyncEvent& e) { events.push_back(e); };
    }

    int count(EventKind kind) const {
        int n = 0;
        for (const auto& e : events) {
            if (e.kind == kind) n++;
        }
        return n;
    }
};

TEST_F(TransferDriverTest, SuccessOnFirstAttempt) {
    runner.script("rsync", ScriptedRun::exit(0)
                               .out("course/notes.pdf")
                               .out("  1,024 100%  1.00MB/s  0:00:00 (xfr#1, to-chk=1/2)")
                               .out("  2,048 100%  1.00MB/s  0:00:00 (xfr#2, to-chk=0/2)"));
    auto driver = make_driver();
    CancelToken cancel;

    auto r = driver.transfer(make_spec(), false, collect(), cancel);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.attempts, 1);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(runner.count("rsync"), 1);
    EXPECT_TRUE(fs::is_directory(test_dir / "dst"));

    ASSERT_EQ(count(EventKind::Progress), 2);
    EXPECT_EQ(count(EventKind::Status), 1);
    EXPECT_EQ(events.back().percent, 100);
}

TEST_F(TransferDriverTest, TransientExitsAreRetried) {
    runner.script("rsync", ScriptedRun::exit(24));
    runner.script("rsync", ScriptedRun::exit(24));
    runner.script("rsync", ScriptedRun::exit(0));
    auto driver = make_driver();
    CancelToken cancel;

    auto r = driver.transfer(make_spec(3), false, collect(), cancel);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.attempts, 3);
    EXPECT_EQ(runner.count("rsync"), 3);
    EXPECT_EQ(count(EventKind::Status), 2);
    EXPECT_NE(events[0].message.find("retry 1 of 3"), std::string::npos);
}

TEST_F(TransferDriverTest, RetriesExhausted) {
    for (int i = 0; i < 3; ++i) runner.script("rsync", ScriptedRun::exit(24));
    auto driver = make_driver();
    CancelToken cancel;

    auto r = driver.transfer(make_spec(2), false, collect(), cancel);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error, ErrorKind::FatalTransfer);
    EXPECT_EQ(r.attempts, 3);
    EXPECT_EQ(runner.count("rsync"), 3);
    EXPECT_NE(r.message.find("after 3 attempts"), std::string::npos);
}

TEST_F(TransferDriverTest, ZeroRetriesMeansOneAttempt) {
    runner.script("rsync", ScriptedRun::exit(24));
    auto driver = make_driver();
    CancelToken cancel;

    auto r = driver.transfer(make_spec(0), false, collect(), cancel);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(runner.count("rsync"), 1);
}

TEST_F(TransferDriverTest, FatalExitIsNotRetried) {
    runner.script("rsync", ScriptedRun::exit(23).err("rsync: read error: Permission denied"));
    auto driver = make_driver();
    CancelToken cancel;

    auto r = driver.transfer(make_spec(3), false, collect(), cancel);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error, ErrorKind::FatalTransfer);
    EXPECT_EQ(r.exit_code, 23);
    EXPECT_EQ(runner.count("rsync"), 1);
    EXPECT_NE(r.message.find("partial transfer"), std::string::npos);
    EXPECT_NE(r.message.find("Permission denied"), std::string::npos);
    EXPECT_EQ(count(EventKind::Error), 1);
}

TEST_F(TransferDriverTest, LaunchErrorIsReported) {
    runner.script("rsync", ScriptedRun::missing());
    auto driver = make_driver();
    CancelToken cancel;

    auto r = driver.transfer(make_spec(), false, collect(), cancel);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error, ErrorKind::Launch);
    EXPECT_NE(r.message.find("rsync"), std::string::npos);
}

TEST_F(TransferDriverTest, MissingLocalSourceFailsWithoutLaunching) {
    auto spec = make_spec();
    spec.source.path = (test_dir / "nope").string();
    auto driver = make_driver();
    CancelToken cancel;

    auto r = driver.transfer(spec, false, collect(), cancel);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(runner.count("rsync"), 0);
    EXPECT_NE(r.message.find("Source does not exist"), std::string::npos);
}

TEST_F(TransferDriverTest, DryRunLeavesDestinationAlone) {
    auto driver = make_driver();
    CancelToken cancel;

    auto r = driver.transfer(make_spec(), true, collect(), cancel);
    EXPECT_TRUE(r.ok());
    EXPECT_FALSE(fs::exists(test_dir / "dst"));
    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_NE(std::find(calls[0].args.begin(), calls[0].args.end(), "--dry-run"),
              calls[0].args.end());
}

TEST_F(TransferDriverTest, InvalidSpecThrowsBeforeLaunch) {
    auto spec = make_spec();
    spec.destination.path = spec.source.path;
    auto driver = make_driver();
    CancelToken cancel;

    EXPECT_THROW(driver.transfer(spec, false, collect(), cancel), ValidationError);
    EXPECT_EQ(runner.count("rsync"), 0);
}

TEST_F(TransferDriverTest, CancelStopsRunningProcess) {
    runner.script("rsync", ScriptedRun::blocking());
    auto driver = make_driver();
    CancelToken cancel;

    std::thread canceller([&] {
        runner.wait_for_started(1);
        cancel.cancel();
    });
    auto r = driver.transfer(make_spec(), false, collect(), cancel);
    canceller.join();

    EXPECT_TRUE(r.cancelled());
    EXPECT_EQ(r.error, ErrorKind::Cancelled);
    EXPECT_EQ(runner.count("rsync"), 1);
}

TEST_F(TransferDriverTest, CancelDuringBackoffSkipsRetry) {
    runner.script("rsync", ScriptedRun::exit(24));
    TransferDriver driver(runner, CopyTool::Rsync);
    driver.set_retry_backoff(std::chrono::seconds(30));
    CancelToken cancel;

    auto on_event = [&](const SyncEvent& e) {
        events.push_back(e);
        // The retry announcement is emitted right before the backoff wait
        if (e.kind == EventKind::Status) cancel.cancel();
    };
    auto r = driver.transfer(make_spec(3), false, on_event, cancel);
    EXPECT_TRUE(r.cancelled());
    EXPECT_EQ(runner.count("rsync"), 1);
}
