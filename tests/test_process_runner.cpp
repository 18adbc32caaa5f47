#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;
using platform::OutputLine;
using platform::OutputStream;
using platform::ReadStatus;

static std::vector<OutputLine> drain(platform::ProcessHandle& handle) {
    std::vector<OutputLine> lines;
    OutputLine line;
    while (true) {
        auto status = handle.next_line(line, 1000);
        if (status == ReadStatus::Closed) break;
        if (status == ReadStatus::Line) lines.push_back(line);
    }
    return lines;
}

static std::string sh_output(const std::string& script, const platform::ProcessOptions& opts = {}) {
    platform::SystemProcessRunner runner;
    auto out = platform::run_captured(runner, "sh", {"-c", script}, opts);
    return out.stdout_data;
}

TEST(ProcessRunner, SplitsStreams) {
    platform::SystemProcessRunner runner;
    auto handle = runner.run("sh", {"-c", "echo one; echo two >&2; echo three"}, {});
    auto lines = drain(*handle);
    EXPECT_EQ(handle->wait(), 0);

    std::vector<std::string> out, err;
    for (const auto& l : lines) {
        (l.stream == OutputStream::Stdout ? out : err).push_back(l.text);
    }
    EXPECT_EQ(out, (std::vector<std::string>{"one", "three"}));
    EXPECT_EQ(err, std::vector<std::string>{"two"});
}

TEST(ProcessRunner, CarriageReturnsSplitLines) {
    platform::SystemProcessRunner runner;
    auto handle = runner.run("sh", {"-c", "printf '10%%\\r20%%\\r30%%\\n'"}, {});
    auto lines = drain(*handle);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text, "10%");
    EXPECT_EQ(lines[2].text, "30%");
}

TEST(ProcessRunner, ExitCode) {
    platform::SystemProcessRunner runner;
    auto out = platform::run_captured(runner, "sh", {"-c", "exit 23"});
    EXPECT_EQ(out.exit_code, 23);
    EXPECT_TRUE(out.failed());
}

TEST(ProcessRunner, EnvironmentOverlay) {
    platform::ProcessOptions opts;
    opts.env["SHARESYNC_TEST_VAR"] = "hello";
    EXPECT_EQ(sh_output("echo $SHARESYNC_TEST_VAR", opts), "hello\n");
    // The rest of the environment is inherited
    EXPECT_NE(sh_output("echo $PATH", opts), "\n");
}

TEST(ProcessRunner, WorkingDirectory) {
    auto dir = fs::canonical(fs::temp_directory_path());
    platform::ProcessOptions opts;
    opts.working_dir = dir.string();
    EXPECT_EQ(sh_output("pwd -P", opts), dir.string() + "\n");
}

TEST(ProcessRunner, StdinData) {
    platform::ProcessOptions opts;
    opts.stdin_data = "secret\n";
    EXPECT_EQ(sh_output("read line; echo got $line", opts), "got secret\n");
}

// cat only finishes once stdin reaches EOF, so the child must not hold the
// write end of its own stdin pipe.
TEST(ProcessRunner, StdinEof) {
    platform::SystemProcessRunner runner;
    platform::ProcessOptions opts;
    opts.stdin_data = "secret\n";
    auto handle = runner.run("sh", {"-c", "cat; echo eof"}, opts);

    std::vector<std::string> out;
    bool closed = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    OutputLine line;
    while (std::chrono::steady_clock::now() < deadline) {
        auto status = handle->next_line(line, 200);
        if (status == ReadStatus::Closed) {
            closed = true;
            break;
        }
        if (status == ReadStatus::Line) out.push_back(line.text);
    }
    if (!closed) handle->cancel();

    ASSERT_TRUE(closed) << "child never saw EOF on stdin";
    EXPECT_EQ(out, (std::vector<std::string>{"secret", "eof"}));
    EXPECT_EQ(handle->wait(), 0);
}

TEST(ProcessRunner, MissingProgramThrows) {
    platform::SystemProcessRunner runner;
    EXPECT_THROW(runner.run("sharesync-no-such-program", {}, {}), LaunchError);
}

TEST(ProcessRunner, BadWorkingDirectoryThrows) {
    platform::SystemProcessRunner runner;
    platform::ProcessOptions opts;
    opts.working_dir = "/nonexistent/sharesync/dir";
    EXPECT_THROW(runner.run("sh", {"-c", "true"}, opts), LaunchError);
}

TEST(ProcessRunner, CancelStopsProcess) {
    platform::SystemProcessRunner runner;
    auto handle = runner.run("sh", {"-c", "echo started; sleep 30"}, {});

    OutputLine line;
    ASSERT_EQ(handle->next_line(line, 5000), ReadStatus::Line);
    EXPECT_EQ(line.text, "started");

    auto begin = std::chrono::steady_clock::now();
    handle->cancel();
    EXPECT_TRUE(handle->cancelled());
    EXPECT_EQ(handle->wait(), PROCESS_EXIT_CANCELLED);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));

    // Safe to repeat
    handle->cancel();
}

TEST(ProcessRunner, TimeoutWhileSilent) {
    platform::SystemProcessRunner runner;
    auto handle = runner.run("sh", {"-c", "sleep 1; echo late"}, {});
    OutputLine line;
    EXPECT_EQ(handle->next_line(line, 50), ReadStatus::Timeout);
    auto lines = drain(*handle);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "late");
    EXPECT_EQ(handle->wait(), 0);
}
