#include "post_steps.hpp"
#include "sync_log.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace fs = std::filesystem;

int run_streamed(platform::ProcessRunner& runner,
                 const std::string& program,
                 const std::vector<std::string>& args,
                 const platform::ProcessOptions& options,
                 const CancelToken& cancel,
                 const EventCallback& on_event) {
    if (cancel.cancelled()) {
        sync_log("step: cancelled before start: " + format_command(program, args));
        return PROCESS_EXIT_CANCELLED;
    }
    sync_log("step: " + format_command(program, args));
    auto handle = runner.run(program, args, options);

    platform::OutputLine line;
    while (true) {
        if (cancel.cancelled()) {
            handle->cancel();
            break;
        }
        auto status = handle->next_line(line, PROCESS_POLL_MS);
        if (status == platform::ReadStatus::Closed) break;
        if (status == platform::ReadStatus::Timeout) continue;
        // git reports routine progress on stderr, so both streams are informational
        if (on_event) on_event(SyncEvent::status(line.text));
    }
    return handle->wait();
}

static StepResult finish_step(int code, const std::string& what) {
    StepResult r;
    if (code == PROCESS_EXIT_CANCELLED) {
        r.cancelled = true;
        r.message = what + " cancelled";
        return r;
    }
    r.ran = true;
    r.ok = code == 0;
    r.message = r.ok ? what + " completed"
                     : fmt::format("{} exited with code {}", what, code);
    return r;
}

StepResult run_repo_pull(platform::ProcessRunner& runner, const std::string& repo_path,
                         const CancelToken& cancel, const EventCallback& on_event) {
    std::error_code ec;
    if (!fs::is_directory(fs::path(repo_path) / ".git", ec)) {
        StepResult r;
        r.message = fmt::format("{} is not a git repository, skipping pull", repo_path);
        return r;
    }

    platform::ProcessOptions opts;
    opts.working_dir = repo_path;
    try {
        return finish_step(run_streamed(runner, "git", {"pull"}, opts, cancel, on_event),
                           "Repository pull");
    } catch (const LaunchError& e) {
        StepResult r;
        r.message = e.what();
        return r;
    }
}

StepResult run_post_script(platform::ProcessRunner& runner, const std::string& script_path,
                           const CancelToken& cancel, const EventCallback& on_event) {
    StepResult r;
    std::error_code ec;
    if (!fs::exists(script_path, ec)) {
        r.message = fmt::format("Post-sync script not found: {}", script_path);
        return r;
    }
    if (!platform::is_executable(script_path)) {
        r.message = fmt::format("Post-sync script is not executable: {}", script_path);
        return r;
    }

    fs::path script = fs::absolute(script_path, ec);
    platform::ProcessOptions opts;
    opts.working_dir = script.parent_path().string();
    try {
        return finish_step(run_streamed(runner, script.string(), {}, opts, cancel, on_event),
                           "Post-sync script");
    } catch (const LaunchError& e) {
        r.message = e.what();
        return r;
    }
}
