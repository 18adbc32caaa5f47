#pragma once

#include <string>
#include <vector>
#include <platform/process.hpp>
#include <core/cancel_token.hpp>
#include "sync_event.hpp"

struct StepResult {
    bool ran = false;       // a process was started and ran to the end
    bool ok = false;
    bool cancelled = false;
    std::string message;
};

// Run a command, forwarding each output line as a status event.
// Returns the exit code (PROCESS_EXIT_CANCELLED if cancel was seen, in which
// case nothing is started when it was already set on entry).
// Throws LaunchError if the program cannot be started.
int run_streamed(platform::ProcessRunner& runner,
                 const std::string& program,
                 const std::vector<std::string>& args,
                 const platform::ProcessOptions& options,
                 const CancelToken& cancel,
                 const EventCallback& on_event);

// `git pull` inside repo_path. Skipped unless repo_path/.git is a directory.
StepResult run_repo_pull(platform::ProcessRunner& runner, const std::string& repo_path,
                         const CancelToken& cancel, const EventCallback& on_event);

// Run the follow-up script from its own directory. Must exist and be executable.
StepResult run_post_script(platform::ProcessRunner& runner, const std::string& script_path,
                           const CancelToken& cancel, const EventCallback& on_event);
