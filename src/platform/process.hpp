#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace platform {

enum class OutputStream { Stdout, Stderr };

struct OutputLine {
    OutputStream stream = OutputStream::Stdout;
    std::string text;
};

enum class ReadStatus {
    Line,       // a line was written to the out parameter
    Timeout,    // nothing arrived within the timeout, the process may still be writing
    Closed,     // both streams reached EOF and every buffered line was delivered
};

struct ProcessOptions {
    std::string working_dir;                    // empty = inherit
    std::map<std::string, std::string> env;     // overlaid on the parent environment
    std::string stdin_data;                     // written then closed; empty = no stdin
};

// A spawned child process. Output is split into lines on '\n' and '\r'
// (tools redraw progress with carriage returns); empty lines are dropped.
// Lines keep their order within a stream; stdout and stderr interleave
// in arrival order with no guarantee between them.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    // Block up to timeout_ms for the next output line.
    virtual ReadStatus next_line(OutputLine& line, int timeout_ms) = 0;

    // Wait for the process to exit. Returns its exit code, PROCESS_EXIT_SIGNALED
    // if it died from a signal, or PROCESS_EXIT_CANCELLED after cancel().
    virtual int wait() = 0;

    // Terminate the process (SIGTERM to its group, SIGKILL after a grace period;
    // TerminateProcess on Windows). Safe to call more than once.
    virtual void cancel() = 0;

    virtual bool cancelled() const = 0;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Spawn exactly one process. Throws LaunchError if the program cannot be
    // started (not found, not executable, bad working directory).
    // A non-zero exit is not an error here; callers interpret exit codes.
    virtual std::unique_ptr<ProcessHandle> run(const std::string& program,
                                               const std::vector<std::string>& args,
                                               const ProcessOptions& options) = 0;
};

// Runner backed by real OS processes.
class SystemProcessRunner : public ProcessRunner {
public:
    SystemProcessRunner();

    std::unique_ptr<ProcessHandle> run(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const ProcessOptions& options) override;
};

// Run a short command to completion and collect its output.
struct CapturedOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

CapturedOutput run_captured(ProcessRunner& runner,
                            const std::string& program,
                            const std::vector<std::string>& args,
                            const ProcessOptions& options = {});

} // namespace platform
