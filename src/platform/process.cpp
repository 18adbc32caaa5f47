#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <cerrno>
extern char** environ;
#endif

namespace platform {

namespace {

// How long wait() lets the readers drain after the process exited. A child
// that daemonizes (openconnect --background) can keep our pipes open forever.
constexpr int READER_DRAIN_MS = 500;

// ── LineChannel ──────────────────────────────────────────────
// Single ordered queue fed by one reader thread per stream.

class LineChannel {
public:
    void push(OutputStream stream, std::string text) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            lines_.push_back({stream, std::move(text)});
        }
        cv_.notify_all();
    }

    void close_stream() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            --open_streams_;
        }
        cv_.notify_all();
    }

    ReadStatus pop(OutputLine& out, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !lines_.empty() || open_streams_ <= 0; });
        if (!lines_.empty()) {
            out = std::move(lines_.front());
            lines_.pop_front();
            return ReadStatus::Line;
        }
        return open_streams_ <= 0 ? ReadStatus::Closed : ReadStatus::Timeout;
    }

    bool wait_closed(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mu_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this] { return open_streams_ <= 0; });
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<OutputLine> lines_;
    int open_streams_ = 2;
};

// Accumulates raw chunks and emits complete lines. '\r' and '\n' both end a line.
class LineSplitter {
public:
    LineSplitter(LineChannel& channel, OutputStream stream)
        : channel_(channel), stream_(stream) {}

    void feed(const char* data, size_t n) {
        for (size_t i = 0; i < n; ++i) {
            char c = data[i];
            if (c == '\n' || c == '\r') {
                flush();
            } else {
                partial_ += c;
            }
        }
    }

    void flush() {
        if (!partial_.empty()) {
            channel_.push(stream_, std::move(partial_));
            partial_.clear();
        }
    }

private:
    LineChannel& channel_;
    OutputStream stream_;
    std::string partial_;
};

} // namespace

#ifndef _WIN32

// ── POSIX handle ─────────────────────────────────────────────

namespace {

class PosixProcessHandle : public ProcessHandle {
public:
    PosixProcessHandle(pid_t pid, int out_fd, int err_fd) : pid_(pid) {
        out_reader_ = std::thread(&PosixProcessHandle::reader_loop, this, out_fd, OutputStream::Stdout);
        err_reader_ = std::thread(&PosixProcessHandle::reader_loop, this, err_fd, OutputStream::Stderr);
    }

    ~PosixProcessHandle() override {
        if (!is_reaped()) {
            cancel();
        }
        stop_readers_ = true;
        join_readers();
    }

    ReadStatus next_line(OutputLine& line, int timeout_ms) override {
        return channel_.pop(line, timeout_ms);
    }

    int wait() override {
        while (!reap()) {
            sleep_ms(20);
        }
        if (!channel_.wait_closed(READER_DRAIN_MS)) {
            stop_readers_ = true;
        }
        join_readers();

        if (cancelled_) return PROCESS_EXIT_CANCELLED;
        return WIFEXITED(status_) ? WEXITSTATUS(status_) : PROCESS_EXIT_SIGNALED;
    }

    void cancel() override {
        cancelled_ = true;
        if (is_reaped()) return;

        // The child leads its own process group, so helpers it forked die too.
        kill(-pid_, SIGTERM);
        kill(pid_, SIGTERM);

        for (int waited = 0; waited < PROCESS_TERM_GRACE_MS; waited += PROCESS_POLL_MS) {
            if (reap()) return;
            sleep_ms(PROCESS_POLL_MS);
        }

        kill(-pid_, SIGKILL);
        kill(pid_, SIGKILL);
        while (!reap()) {
            sleep_ms(10);
        }
    }

    bool cancelled() const override { return cancelled_; }

private:
    void reader_loop(int fd, OutputStream stream) {
        LineSplitter splitter(channel_, stream);
        char buf[PROCESS_READ_BUF_SIZE];

        while (true) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int ready = poll(&pfd, 1, PROCESS_POLL_MS);
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (ready == 0) {
                if (stop_readers_) break;
                continue;
            }

            ssize_t n = read(fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            splitter.feed(buf, static_cast<size_t>(n));
        }

        splitter.flush();
        close(fd);
        channel_.close_stream();
    }

    bool is_reaped() {
        std::lock_guard<std::mutex> lock(state_mu_);
        return reaped_;
    }

    // Non-blocking waitpid. Returns true once the child has been collected.
    bool reap() {
        std::lock_guard<std::mutex> lock(state_mu_);
        if (reaped_) return true;

        int status = 0;
        pid_t r;
        do {
            r = waitpid(pid_, &status, WNOHANG);
        } while (r < 0 && errno == EINTR);

        if (r == pid_) {
            reaped_ = true;
            status_ = status;
            return true;
        }
        if (r < 0) {
            // ECHILD: someone else collected it; report it as signaled
            reaped_ = true;
            status_ = SIGKILL;
            return true;
        }
        return false;
    }

    void join_readers() {
        if (out_reader_.joinable()) out_reader_.join();
        if (err_reader_.joinable()) err_reader_.join();
    }

    pid_t pid_;
    LineChannel channel_;
    std::thread out_reader_;
    std::thread err_reader_;
    std::atomic<bool> stop_readers_{false};
    std::atomic<bool> cancelled_{false};

    std::mutex state_mu_;
    bool reaped_ = false;
    int status_ = 0;
};

void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

// Both ends close-on-exec, so a child spawned concurrently from another
// thread never inherits them. macOS has no pipe2().
bool make_pipe(int fds[2]) {
#ifdef __APPLE__
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#else
    return pipe2(fds, O_CLOEXEC) == 0;
#endif
}

// Child side: place fd on target without the close-on-exec flag.
void move_to(int fd, int target) {
    if (fd == target) {
        fcntl(fd, F_SETFD, 0);
    } else {
        dup2(fd, target);
    }
}

void close_above_stdio(int fd) {
    if (fd > STDERR_FILENO) close(fd);
}

} // namespace

SystemProcessRunner::SystemProcessRunner() {
    // Writing stdin to a child that already exited must fail with EPIPE, not kill us.
    signal(SIGPIPE, SIG_IGN);
}

std::unique_ptr<ProcessHandle> SystemProcessRunner::run(const std::string& program,
                                                        const std::vector<std::string>& args,
                                                        const ProcessOptions& options) {
    std::string exe = find_executable(program);
    if (exe.empty()) {
        throw LaunchError(program, "command not found");
    }

    // Everything the child needs is prepared before fork(): allocating in the
    // child of a multithreaded parent is not safe.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && options.env.count(entry.substr(0, eq))) continue;
        env_storage.push_back(std::move(entry));
    }
    for (const auto& [k, v] : options.env) {
        env_storage.push_back(k + "=" + v);
    }
    std::vector<const char*> envp;
    for (const auto& e : env_storage) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    const char* workdir = options.working_dir.empty() ? nullptr : options.working_dir.c_str();
    bool feed_stdin = !options.stdin_data.empty();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // reports exec failure; closed by a successful exec

    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe) ||
        (feed_stdin && !make_pipe(in_pipe))) {
        int err = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(in_pipe);
        close_pair(exec_pipe);
        throw LaunchError(program, std::string("pipe failed: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(in_pipe);
        close_pair(exec_pipe);
        throw LaunchError(program, std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        if (feed_stdin) {
            move_to(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                move_to(devnull, STDIN_FILENO);
                close_above_stdio(devnull);
            }
        }
        move_to(out_pipe[1], STDOUT_FILENO);
        move_to(err_pipe[1], STDERR_FILENO);

        // Only the dup'd stdio copies survive; the stdin write end in
        // particular must go or the child never sees EOF.
        // exec_pipe[1] stays open until execve closes it.
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
                       in_pipe[0], in_pipe[1], exec_pipe[0]}) {
            close_above_stdio(fd);
        }

        int child_err = 0;
        if (workdir && chdir(workdir) != 0) {
            child_err = errno;
        } else {
            execve(exe.c_str(), const_cast<char* const*>(argv.data()),
                   const_cast<char* const*>(envp.data()));
            child_err = errno;
        }
        ssize_t ignored = write(exec_pipe[1], &child_err, sizeof(child_err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);
    if (feed_stdin) close(in_pipe[0]);

    int child_err = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_err, sizeof(child_err));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_err))) {
        waitpid(pid, nullptr, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        if (feed_stdin) close(in_pipe[1]);
        std::string reason = workdir
            ? std::string(std::strerror(child_err)) + " (working directory: " + options.working_dir + ")"
            : std::string(std::strerror(child_err));
        throw LaunchError(program, reason);
    }

    auto handle = std::make_unique<PosixProcessHandle>(pid, out_pipe[0], err_pipe[0]);

    if (feed_stdin) {
        const char* p = options.stdin_data.data();
        size_t left = options.stdin_data.size();
        while (left > 0) {
            ssize_t w = write(in_pipe[1], p, left);
            if (w < 0 && errno == EINTR) continue;
            if (w <= 0) break;   // child closed stdin early; its exit code tells the story
            p += w;
            left -= static_cast<size_t>(w);
        }
        close(in_pipe[1]);
    }

    return handle;
}

#else // _WIN32

// ── Windows handle ───────────────────────────────────────────

namespace {

class WinProcessHandle : public ProcessHandle {
public:
    WinProcessHandle(HANDLE process, HANDLE thread, HANDLE out_read, HANDLE err_read)
        : process_(process), thread_(thread) {
        out_reader_ = std::thread(&WinProcessHandle::reader_loop, this, out_read, OutputStream::Stdout);
        err_reader_ = std::thread(&WinProcessHandle::reader_loop, this, err_read, OutputStream::Stderr);
    }

    ~WinProcessHandle() override {
        if (WaitForSingleObject(process_, 0) == WAIT_TIMEOUT) {
            cancel();
        }
        drain_and_join();
        CloseHandle(process_);
        CloseHandle(thread_);
    }

    ReadStatus next_line(OutputLine& line, int timeout_ms) override {
        return channel_.pop(line, timeout_ms);
    }

    int wait() override {
        WaitForSingleObject(process_, INFINITE);
        drain_and_join();

        if (cancelled_) return PROCESS_EXIT_CANCELLED;
        DWORD code = 1;
        GetExitCodeProcess(process_, &code);
        return static_cast<int>(code);
    }

    void cancel() override {
        cancelled_ = true;
        if (WaitForSingleObject(process_, 0) == WAIT_TIMEOUT) {
            TerminateProcess(process_, 1);
            WaitForSingleObject(process_, PROCESS_TERM_GRACE_MS);
        }
    }

    bool cancelled() const override { return cancelled_; }

private:
    void reader_loop(HANDLE pipe, OutputStream stream) {
        LineSplitter splitter(channel_, stream);
        char buf[PROCESS_READ_BUF_SIZE];
        DWORD n = 0;
        while (ReadFile(pipe, buf, sizeof(buf), &n, nullptr) && n > 0) {
            splitter.feed(buf, n);
        }
        splitter.flush();
        CloseHandle(pipe);
        channel_.close_stream();
    }

    void drain_and_join() {
        if (!channel_.wait_closed(READER_DRAIN_MS)) {
            if (out_reader_.joinable()) CancelSynchronousIo(out_reader_.native_handle());
            if (err_reader_.joinable()) CancelSynchronousIo(err_reader_.native_handle());
        }
        if (out_reader_.joinable()) out_reader_.join();
        if (err_reader_.joinable()) err_reader_.join();
    }

    HANDLE process_;
    HANDLE thread_;
    LineChannel channel_;
    std::thread out_reader_;
    std::thread err_reader_;
    std::atomic<bool> cancelled_{false};
};

std::string quote_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) return arg;
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') out += '\\';
        out += c;
    }
    out += "\"";
    return out;
}

} // namespace

SystemProcessRunner::SystemProcessRunner() = default;

std::unique_ptr<ProcessHandle> SystemProcessRunner::run(const std::string& program,
                                                        const std::vector<std::string>& args,
                                                        const ProcessOptions& options) {
    std::string cmdline = quote_arg(program);
    for (const auto& a : args) cmdline += " " + quote_arg(a);

    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE out_r, out_w, err_r, err_w, in_r = nullptr, in_w = nullptr;
    CreatePipe(&out_r, &out_w, &sa, 0);
    CreatePipe(&err_r, &err_w, &sa, 0);
    SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_r, HANDLE_FLAG_INHERIT, 0);
    if (!options.stdin_data.empty()) {
        CreatePipe(&in_r, &in_w, &sa, 0);
        SetHandleInformation(in_w, HANDLE_FLAG_INHERIT, 0);
    }

    // Environment block: parent variables overridden by options.env
    std::string env_block;
    if (!options.env.empty()) {
        LPCH parent = GetEnvironmentStringsA();
        for (LPCH p = parent; *p; p += std::strlen(p) + 1) {
            std::string entry(p);
            auto eq = entry.find('=', 1);
            if (eq != std::string::npos && options.env.count(entry.substr(0, eq))) continue;
            env_block += entry;
            env_block.push_back('\0');
        }
        FreeEnvironmentStringsA(parent);
        for (const auto& [k, v] : options.env) {
            env_block += k + "=" + v;
            env_block.push_back('\0');
        }
        env_block.push_back('\0');
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = out_w;
    si.hStdError = err_w;
    si.hStdInput = in_r ? in_r : GetStdHandle(STD_INPUT_HANDLE);

    PROCESS_INFORMATION pi = {};
    BOOL ok = CreateProcessA(nullptr, cmdline.data(), nullptr, nullptr, TRUE,
                             CREATE_NO_WINDOW,
                             env_block.empty() ? nullptr : env_block.data(),
                             options.working_dir.empty() ? nullptr : options.working_dir.c_str(),
                             &si, &pi);
    DWORD err = ok ? 0 : GetLastError();

    CloseHandle(out_w);
    CloseHandle(err_w);
    if (in_r) CloseHandle(in_r);

    if (!ok) {
        CloseHandle(out_r);
        CloseHandle(err_r);
        if (in_w) CloseHandle(in_w);
        throw LaunchError(program, err == ERROR_FILE_NOT_FOUND
                                       ? "command not found"
                                       : "CreateProcess failed with error " + std::to_string(err));
    }

    auto handle = std::make_unique<WinProcessHandle>(pi.hProcess, pi.hThread, out_r, err_r);

    if (in_w) {
        DWORD written = 0;
        WriteFile(in_w, options.stdin_data.data(),
                  static_cast<DWORD>(options.stdin_data.size()), &written, nullptr);
        CloseHandle(in_w);
    }

    return handle;
}

#endif

// ── run_captured ─────────────────────────────────────────────

CapturedOutput run_captured(ProcessRunner& runner,
                            const std::string& program,
                            const std::vector<std::string>& args,
                            const ProcessOptions& options) {
    CapturedOutput result;
    auto handle = runner.run(program, args, options);

    // Readers buffer everything, so waiting first cannot stall the child.
    result.exit_code = handle->wait();

    OutputLine line;
    while (handle->next_line(line, 0) == ReadStatus::Line) {
        auto& sink = line.stream == OutputStream::Stdout ? result.stdout_data : result.stderr_data;
        sink += line.text;
        sink += "\n";
    }
    return result;
}

} // namespace platform
