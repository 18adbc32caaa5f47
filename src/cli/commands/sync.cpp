#include "../base_cli.hpp"
#include "../preflight.hpp"
#include "../run_printer.hpp"
#include "../theme.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <sstream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/sync_spec.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <sync/size_estimate.hpp>
#include <sync/transfer_command.hpp>

// Exit statuses for a one-shot run
static constexpr int EXIT_RUN_FAILED = 1;
static constexpr int EXIT_RUN_CANCELLED = 130;

static std::atomic<bool> g_interrupted{false};

static void on_sigint(int) {
    g_interrupted = true;
}

struct RunArgs {
    bool dry_run = false;
    std::string profile;
};

static RunArgs parse_run_args(const std::string& arg) {
    RunArgs out;
    std::istringstream iss(arg);
    std::string tok;
    while (iss >> tok) {
        if (tok == "--dry-run" || tok == "-n") {
            out.dry_run = true;
        } else if (tok == "--profile" || tok == "-p") {
            if (!(iss >> out.profile)) {
                throw std::runtime_error("--profile needs a path");
            }
        } else {
            throw std::runtime_error("Unknown option: " + tok);
        }
    }
    return out;
}

// Prints issues; true if any of them blocks the run.
static bool report_preflight(const std::vector<PreflightIssue>& issues) {
    bool blocking = false;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            blocking = true;
        }
        std::cout << theme::step(issue.fix);
    }
    return blocking;
}

static void print_outcome(BaseCLI& cli, const RunOutcome& outcome) {
    std::cout << theme::divider();
    for (const auto& src : outcome.sources) {
        if (src.result.ok()) {
            std::cout << theme::ok(src.source);
        } else if (src.result.cancelled()) {
            std::cout << theme::info(src.source + ": cancelled");
        } else {
            std::cout << theme::fail(src.source + ": " + src.result.message);
        }
    }
    for (const auto& w : outcome.warnings) {
        std::cout << theme::info("Warning: " + w);
    }
    switch (outcome.kind) {
        case OutcomeKind::Success:   std::cout << theme::ok(outcome.message); break;
        case OutcomeKind::Failure:   std::cout << theme::fail(outcome.message); break;
        case OutcomeKind::Cancelled: std::cout << theme::info(outcome.message); break;
    }
    if (cli.recorder) {
        std::cout << theme::kv("Log", cli.recorder->log_path().string());
    }
    std::cout << "\n";
}

// Blocks until the run ends, redrawing a progress bar. Ctrl-C cancels.
static void run_foreground(BaseCLI& cli, const SyncJob& job, const RunOptions& options) {
    g_interrupted = false;
    auto previous = std::signal(SIGINT, on_sigint);

    auto started = cli.orchestrator->start(job, options);
    if (started.is_err()) {
        std::signal(SIGINT, previous);
        std::cout << theme::fail(started.error);
        cli.exit_code = EXIT_RUN_FAILED;
        return;
    }

    RunPrinter printer(false);
    bool cancel_sent = false;
    SyncEvent event;
    while (true) {
        if (g_interrupted && !cancel_sent) {
            printer.finish();
            std::cout << theme::info("Cancelling...");
            cli.orchestrator->cancel();
            cancel_sent = true;
        }
        if (!cli.orchestrator->poll_event(event, PROCESS_POLL_MS)) {
            if (!cli.orchestrator->active()) break;
            continue;
        }
        printer.print(event);
        if (event.kind == EventKind::Done) break;
    }
    printer.finish();
    std::signal(SIGINT, previous);

    auto outcome = cli.orchestrator->wait();
    if (!outcome) {
        cli.exit_code = EXIT_RUN_FAILED;
        return;
    }
    print_outcome(cli, *outcome);
    if (outcome->kind == OutcomeKind::Failure) cli.exit_code = EXIT_RUN_FAILED;
    if (outcome->kind == OutcomeKind::Cancelled) cli.exit_code = EXIT_RUN_CANCELLED;
}

static void do_run(BaseCLI& cli, const std::string& arg) {
    RunArgs args = parse_run_args(arg);

    if (cli.orchestrator->active()) {
        std::cout << theme::fail("A sync is already running.");
        std::cout << theme::step("Wait for it to finish or type 'cancel'.");
        cli.exit_code = EXIT_RUN_FAILED;
        return;
    }
    if (!cli.require_config(args.profile)) {
        cli.exit_code = EXIT_RUN_FAILED;
        return;
    }
    const Config& config = cli.config.value();

    if (report_preflight(run_preflight_checks(config))) {
        cli.exit_code = EXIT_RUN_FAILED;
        return;
    }

    SyncJob job = build_sync_job(config);
    SyncOrchestrator::validate_job(job);

    RunOptions options;
    options.dry_run = args.dry_run;
    options.credentials = cli.credentials();

    if (!cli.interactive) {
        std::cout << theme::section(args.dry_run ? "Dry run" : "Sync");
        std::cout << theme::kv("Profile", config.profile().name);
        std::cout << theme::kv("Transfers", std::to_string(job.transfers.size()));
        std::cout << theme::kv("Destination", config.profile().destination);
        std::cout << "\n";
        run_foreground(cli, job, options);
        return;
    }

    auto started = cli.orchestrator->start(job, options);
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return;
    }
    std::cout << theme::info(fmt::format("{} started (run {}). Type 'cancel' to stop it.",
                                         args.dry_run ? "Dry run" : "Sync", started.value));
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    if (!cli.orchestrator->active()) {
        std::cout << theme::info("No sync is running.");
        return;
    }
    cli.orchestrator->cancel();
    std::cout << theme::info("Cancellation requested.");
}

static void do_preview(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config(arg)) {
        cli.exit_code = EXIT_RUN_FAILED;
        return;
    }
    SyncJob job = build_sync_job(cli.config.value());
    CopyTool tool = default_copy_tool();

    std::cout << theme::section("Preview");
    uint64_t files = 0, bytes = 0;
    for (const auto& spec : job.transfers) {
        std::cout << "\n  " << theme::bold(spec.source.path) << "\n";
        std::cout << theme::kv("To", spec.destination.path);
        std::cout << theme::kv("Mode", fmt::format("{}, {}", to_string(spec.mode),
                                                   to_string(spec.direction)));

        auto cmd = build_transfer_command(spec, true, tool);
        std::cout << theme::kv("Command", format_command(cmd.program, cmd.args));
        for (const auto& note : cmd.notes) {
            std::cout << theme::info(note);
        }

        auto estimate = estimate_transfer_size(spec);
        if (estimate.is_err()) {
            std::cout << theme::fail(estimate.error);
            continue;
        }
        const auto& e = estimate.value;
        std::string size = fmt::format("{} files, {}", e.file_count, format_bytes(e.total_bytes));
        if (e.skipped > 0) size += fmt::format(" ({} filtered out)", e.skipped);
        if (!e.complete) size += " (partial: some folders were unreadable)";
        std::cout << theme::kv("Size", size);
        files += e.file_count;
        bytes += e.total_bytes;
    }
    std::cout << theme::divider();
    std::cout << theme::kv("Total", fmt::format("{} files, {}", files, format_bytes(bytes)));
    std::cout << theme::dim("    Upper bound: files already up to date are not subtracted.") << "\n\n";
}

static void do_history(BaseCLI& cli, const std::string& arg) {
    if (arg == "clear") {
        cli.history->clear();
        std::cout << theme::ok("History cleared.");
        return;
    }

    int limit = arg.empty() ? 10 : safe_stoi(arg, 10);
    auto runs = cli.history->load();
    if (runs.empty()) {
        std::cout << theme::info("No runs recorded yet.");
        return;
    }

    std::cout << theme::section("History");
    int shown = 0;
    for (auto it = runs.rbegin(); it != runs.rend() && shown < limit; ++it, ++shown) {
        std::string outcome = it->outcome;
        if (outcome == "success") outcome = theme::green(outcome);
        else if (outcome == "failure") outcome = theme::red(outcome);
        else outcome = theme::yellow(outcome);

        std::cout << fmt::format("    {}  {:<18} {}{}\n",
                                 theme::dim(format_timestamp(it->started_at)),
                                 it->job_name, outcome,
                                 it->dry_run ? theme::dim(" (dry run)") : "");
        std::cout << theme::dim(fmt::format("      {} [{}]", it->message,
                                            format_duration(it->started_at, it->finished_at)))
                  << "\n";
    }
    std::cout << "\n";
}

void register_sync_commands(BaseCLI& cli) {
    cli.add_command("run", do_run, "Run the sync job [--dry-run] [--profile PATH]");
    cli.add_command("cancel", do_cancel, "Cancel the running sync");
    cli.add_command("preview", do_preview, "Show what a run would copy [PROFILE]");
    cli.add_command("history", do_history, "List recent runs [N | clear]");
}
