#include <gtest/gtest.h>
#include <network/linux_probe.hpp>
#include <network/windows_probe.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include "fakes.hpp"

namespace fs = std::filesystem;

static bool has_arg(const std::vector<std::string>& args, const std::string& arg) {
    return std::find(args.begin(), args.end(), arg) != args.end();
}

// ── Linux probe ─────────────────────────────────────────────

class LinuxProbeTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path mounts_file;
    FakeProcessRunner runner;
    NetworkSettings settings;
    CancelToken cancel;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("sharesync_probe_" + std::string(
                       ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        mounts_file = test_dir / "mounts";
        std::ofstream(mounts_file) << "proc /proc proc rw 0 0\n";

        settings.vpn_host = "vpn.example.edu";
        settings.vpn_protocol = "anyconnect";
        settings.share_host = "files.example.edu";
        settings.share_path = "data";
        settings.mount_point = (test_dir / "my share").string();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    LinuxConnectionProbe make_probe() {
        return LinuxConnectionProbe(settings, runner, mounts_file.string());
    }

    void add_mount(const std::string& line) {
        std::ofstream(mounts_file, std::ios::app) << line << "\n";
    }
};

TEST_F(LinuxProbeTest, NotMountedWhenHostAbsent) {
    auto probe = make_probe();
    EXPECT_FALSE(probe.check_share_mounted());
}

TEST_F(LinuxProbeTest, MountedWithEscapedMountPoint) {
    std::string escaped = settings.mount_point;
    escaped.replace(escaped.find(' '), 1, "\\040");
    add_mount("//files.example.edu/data " + escaped + " cifs rw 0 0");
    auto probe = make_probe();
    EXPECT_TRUE(probe.check_share_mounted());
}

TEST_F(LinuxProbeTest, OtherMountPointDoesNotCount) {
    add_mount("//files.example.edu/data /mnt/elsewhere cifs rw 0 0");
    auto probe = make_probe();
    EXPECT_FALSE(probe.check_share_mounted());
}

TEST_F(LinuxProbeTest, VpnCheckPingsShareHost) {
    runner.script("ping", ScriptedRun::exit(1));
    runner.script("ping", ScriptedRun::exit(0));
    auto probe = make_probe();

    EXPECT_FALSE(probe.check_vpn());
    EXPECT_TRUE(probe.check_vpn());
    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].args.back(), "files.example.edu");
    EXPECT_TRUE(has_arg(calls[0].args, "-c"));
}

TEST_F(LinuxProbeTest, MountRefusedWithoutVpn) {
    runner.script("ping", ScriptedRun::exit(1));
    auto probe = make_probe();
    Credentials creds{"jdoe", "secret"};

    auto r = probe.mount_share(creds);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectionError::VPNRequired);
    EXPECT_EQ(runner.count("sudo"), 0);
}

TEST_F(LinuxProbeTest, MountPassesPasswordThroughEnvironment) {
    auto probe = make_probe();
    Credentials creds{"jdoe", "s3cret"};

    auto r = probe.mount_share(creds);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_TRUE(fs::is_directory(settings.mount_point));

    Invocation mount;
    for (const auto& c : runner.calls()) {
        if (c.program == "sudo") mount = c;
    }
    EXPECT_TRUE(has_arg(mount.args, "--preserve-env=PASSWD"));
    EXPECT_TRUE(has_arg(mount.args, "cifs"));
    EXPECT_TRUE(has_arg(mount.args, "//files.example.edu/data"));
    EXPECT_TRUE(has_arg(mount.args, settings.mount_point));
    EXPECT_FALSE(has_arg(mount.args, "s3cret"));
    EXPECT_EQ(mount.options.env.at("PASSWD"), "s3cret");
}

TEST_F(LinuxProbeTest, MountFailureClassifiesAuth) {
    runner.script("sudo", ScriptedRun::exit(32).err("mount error(13): Permission denied"));
    auto probe = make_probe();

    auto r = probe.mount_share(Credentials{"jdoe", "wrong"});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectionError::AuthFailed);
    EXPECT_NE(r.message.find("Permission denied"), std::string::npos);
}

TEST_F(LinuxProbeTest, AlreadyMountedIsNoOp) {
    std::string escaped = settings.mount_point;
    escaped.replace(escaped.find(' '), 1, "\\040");
    add_mount("//files.example.edu/data " + escaped + " cifs rw 0 0");
    auto probe = make_probe();

    auto r = probe.mount_share(Credentials{"jdoe", "x"});
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(runner.calls().empty());
}

TEST_F(LinuxProbeTest, ConnectNeedsCredentials) {
    runner.script("ping", ScriptedRun::exit(1));
    auto probe = make_probe();

    auto r = probe.connect_vpn(Credentials{}, cancel);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectionError::AuthFailed);
    EXPECT_EQ(runner.count("sudo"), 0);
}

TEST_F(LinuxProbeTest, ConnectSendsPasswordOnStdin) {
    runner.script("ping", ScriptedRun::exit(1));
    auto probe = make_probe();

    auto r = probe.connect_vpn(Credentials{"jdoe", "s3cret"}, cancel);
    ASSERT_TRUE(r.success) << r.message;

    Invocation oc;
    for (const auto& c : runner.calls()) {
        if (c.program == "sudo") oc = c;
    }
    EXPECT_TRUE(has_arg(oc.args, "openconnect"));
    EXPECT_TRUE(has_arg(oc.args, "--protocol=anyconnect"));
    EXPECT_TRUE(has_arg(oc.args, "vpn.example.edu"));
    EXPECT_FALSE(has_arg(oc.args, "s3cret"));
    EXPECT_EQ(oc.options.stdin_data, "s3cret\n");
}

TEST_F(LinuxProbeTest, CancelStopsWaitingForTunnel) {
    runner.script_default("ping", ScriptedRun::exit(1));
    auto probe = make_probe();

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto r = probe.connect_vpn(Credentials{"jdoe", "s3cret"}, cancel);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    canceller.join();

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectionError::Cancelled);
    EXPECT_EQ(runner.count("sudo"), 1);
    EXPECT_LT(ms, 1500);
}

TEST_F(LinuxProbeTest, CancelledConnectStartsNothing) {
    cancel.cancel();
    auto probe = make_probe();

    auto r = probe.connect_vpn(Credentials{"jdoe", "s3cret"}, cancel);
    EXPECT_EQ(r.error, ConnectionError::Cancelled);
    EXPECT_TRUE(runner.calls().empty());
}

TEST_F(LinuxProbeTest, CancelStopsWaitingForDisconnect) {
    runner.script_default("ping", ScriptedRun::exit(0));
    auto probe = make_probe();

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto r = probe.disconnect_vpn(cancel);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    canceller.join();

    EXPECT_EQ(r.error, ConnectionError::Cancelled);
    EXPECT_LT(ms, 1500);
}

TEST_F(LinuxProbeTest, MissingToolReadsAsFailure) {
    runner.script("ping", ScriptedRun::missing());
    auto probe = make_probe();
    EXPECT_FALSE(probe.check_vpn());
}

// ── ensure ──────────────────────────────────────────────────

TEST(EnsureConnections, NothingRequired) {
    FakeProbe probe;
    CancelToken cancel;
    auto r = probe.ensure(false, false, {}, cancel, nullptr);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(probe.connect_calls, 0);
    EXPECT_EQ(probe.mount_calls, 0);
}

TEST(EnsureConnections, ConnectsThenMounts) {
    FakeProbe probe;
    CancelToken cancel;
    std::vector<std::string> messages;
    auto r = probe.ensure(true, true, Credentials{"u", "p"}, cancel,
                          [&](const std::string& m) { messages.push_back(m); });
    EXPECT_TRUE(r.success);
    EXPECT_EQ(probe.connect_calls, 1);
    EXPECT_EQ(probe.mount_calls, 1);
    EXPECT_EQ(probe.last_creds.username, "u");
    EXPECT_FALSE(messages.empty());
}

TEST(EnsureConnections, ShareWithoutVpnPermission) {
    FakeProbe probe;
    CancelToken cancel;
    auto r = probe.ensure(false, true, {}, cancel, nullptr);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectionError::VPNRequired);
    EXPECT_EQ(probe.mount_calls, 0);
}

TEST(EnsureConnections, VpnFailureNamesVpn) {
    FakeProbe probe;
    CancelToken cancel;
    probe.connect_result = ConnectionResult::Err(ConnectionError::AuthFailed, "bad password");
    auto r = probe.ensure(true, true, {}, cancel, nullptr);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectionError::AuthFailed);
    EXPECT_NE(r.message.find("VPN"), std::string::npos);
    EXPECT_EQ(probe.mount_calls, 0);
}

TEST(EnsureConnections, MountFailureNamesShare) {
    FakeProbe probe;
    CancelToken cancel;
    probe.vpn_up = true;
    probe.mount_result = ConnectionResult::Err(ConnectionError::CommandFailed, "mount error");
    auto r = probe.ensure(true, true, {}, cancel, nullptr);
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.message.find("share"), std::string::npos);
    EXPECT_EQ(probe.connect_calls, 0);
}

TEST(EnsureConnections, CancelledBeforeAnyStep) {
    FakeProbe probe;
    CancelToken cancel;
    cancel.cancel();
    auto r = probe.ensure(true, true, {}, cancel, nullptr);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectionError::Cancelled);
    EXPECT_EQ(probe.connect_calls, 0);
    EXPECT_EQ(probe.mount_calls, 0);
}

// ── Windows probe ───────────────────────────────────────────

class WindowsProbeTest : public ::testing::Test {
protected:
    FakeProcessRunner runner;
    NetworkSettings settings;
    CancelToken cancel;

    void SetUp() override {
        settings.share_host = "Files.Example.edu";
        settings.share_path = "data";
    }
};

TEST_F(WindowsProbeTest, FindsMappedDrive) {
    runner.script("net", ScriptedRun::exit(0)
        .out("New connections will be remembered.")
        .out("")
        .out("Status       Local     Remote                    Network")
        .out("-------------------------------------------------------------------------------")
        .out("OK           Y:        \\\\other\\home              Microsoft Windows Network")
        .out("OK           Z:        \\\\files.example.edu\\data  Microsoft Windows Network")
        .out("The command completed successfully."));
    WindowsConnectionProbe probe(settings, runner);
    EXPECT_EQ(probe.mapped_drive(), "Z:");
}

TEST_F(WindowsProbeTest, NotMappedWhenNetUseFails) {
    runner.script("net", ScriptedRun::exit(2));
    WindowsConnectionProbe probe(settings, runner);
    EXPECT_FALSE(probe.check_share_mounted());
}

TEST_F(WindowsProbeTest, VpnActionsUnsupported) {
    runner.script("ping", ScriptedRun::exit(1));
    runner.script("ping", ScriptedRun::exit(0));
    WindowsConnectionProbe probe(settings, runner);

    auto c = probe.connect_vpn(Credentials{"u", "p"}, cancel);
    EXPECT_FALSE(c.success);
    EXPECT_EQ(c.error, ConnectionError::Unsupported);

    auto d = probe.disconnect_vpn(cancel);
    EXPECT_FALSE(d.success);
    EXPECT_EQ(d.error, ConnectionError::Unsupported);
}
