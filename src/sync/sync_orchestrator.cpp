#include "sync_orchestrator.hpp"
#include "post_steps.hpp"
#include "sync_log.hpp"
#include <core/errors.hpp>
#include <core/sync_spec.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

const char* to_string(RunState state) {
    switch (state) {
        case RunState::Idle:                return "idle";
        case RunState::EnsuringConnections: return "ensuring connections";
        case RunState::Transferring:        return "transferring";
        case RunState::RepoSync:            return "repository pull";
        case RunState::PostScript:          return "post-sync script";
        case RunState::Cancelling:          return "cancelling";
        case RunState::Done:                return "done";
    }
    return "idle";
}

const char* to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Success:   return "success";
        case OutcomeKind::Failure:   return "failure";
        case OutcomeKind::Cancelled: return "cancelled";
    }
    return "failure";
}

// ── Construction / Destruction ──────────────────────────────

SyncOrchestrator::SyncOrchestrator(ConnectionProbe& probe, platform::ProcessRunner& runner,
                                   TransferDriver& driver)
    : probe_(probe), runner_(runner), driver_(driver) {}

SyncOrchestrator::~SyncOrchestrator() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

// ── Validation ──────────────────────────────────────────────

void SyncOrchestrator::validate_job(const SyncJob& job) {
    std::vector<std::string> violations;
    if (job.transfers.empty()) {
        violations.push_back("At least one source is required");
    }
    for (const auto& spec : job.transfers) {
        for (auto& v : validate_spec(spec)) {
            if (job.transfers.size() > 1) {
                v = fmt::format("{}: {}", spec.source.path.empty() ? "<empty>" : spec.source.path, v);
            }
            violations.push_back(std::move(v));
        }
    }
    if (!violations.empty()) {
        throw ValidationError(violations);
    }
}

// ── Public API ──────────────────────────────────────────────

std::shared_ptr<RunContext> SyncOrchestrator::prepare(const SyncJob& job,
                                                      const RunOptions& options) {
    auto ctx = std::make_shared<RunContext>();
    ctx->run_id = make_run_id();
    ctx->job_name = job.name;
    ctx->started_at = now_iso();
    ctx->dry_run = options.dry_run;
    ctx->cancel = std::make_shared<CancelToken>();

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = RunState::Idle;
    cancel_ = ctx->cancel;
    return ctx;
}

Result<std::string> SyncOrchestrator::start(const SyncJob& job, const RunOptions& options) {
    validate_job(job);

    bool expected = false;
    if (!active_.compare_exchange_strong(expected, true)) {
        return Result<std::string>::Err("A sync run is already in progress");
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    events_.clear();
    auto ctx = prepare(job, options);
    worker_ = std::thread([this, ctx, job, options]() {
        execute(*ctx, job, options);
    });
    return Result<std::string>::Ok(ctx->run_id);
}

RunOutcome SyncOrchestrator::run(const SyncJob& job, const RunOptions& options) {
    validate_job(job);

    bool expected = false;
    if (!active_.compare_exchange_strong(expected, true)) {
        throw std::runtime_error("A sync run is already in progress");
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    events_.clear();
    auto ctx = prepare(job, options);
    return execute(*ctx, job, options);
}

void SyncOrchestrator::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_ && active_) {
        sync_log("orchestrator: cancel requested");
        cancel_->cancel();
        RunState expected = state_;
        if (expected != RunState::Done) {
            state_.compare_exchange_strong(expected, RunState::Cancelling);
        }
    }
}

void SyncOrchestrator::set_state(RunState state) {
    RunState current = state_;
    while (current != RunState::Cancelling &&
           !state_.compare_exchange_weak(current, state)) {
    }
}

std::optional<RunOutcome> SyncOrchestrator::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
    return last_outcome();
}

bool SyncOrchestrator::poll_event(SyncEvent& out, int timeout_ms) {
    return events_.pop(out, timeout_ms);
}

std::optional<RunOutcome> SyncOrchestrator::last_outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_outcome_;
}

// ── Events and progress ─────────────────────────────────────

void SyncOrchestrator::emit(RunContext& ctx, SyncEvent event) {
    ctx.events.push_back(event);
    if (recorder_) recorder_->record(event);
    if (sink_) sink_(event);
    events_.push(std::move(event));
}

void SyncOrchestrator::emit_progress(RunContext& ctx, double step_fraction,
                                     const std::string& msg) {
    if (ctx.total_units <= 0) return;
    if (step_fraction < 0.0) step_fraction = 0.0;
    if (step_fraction > 1.0) step_fraction = 1.0;

    int pct = static_cast<int>(std::floor(
        100.0 * (ctx.completed_units + step_fraction) / ctx.total_units));
    if (pct > 100) pct = 100;
    // Retries restart a transfer's own percentage; the overall value never goes back
    if (pct <= ctx.last_percent) return;
    ctx.last_percent = pct;
    emit(ctx, SyncEvent::progress(pct, msg));
}

void SyncOrchestrator::complete_unit(RunContext& ctx, const std::string& msg) {
    ctx.completed_units++;
    emit_progress(ctx, 0.0, msg);
}

// ── Run ─────────────────────────────────────────────────────

RunOutcome SyncOrchestrator::execute(RunContext& ctx, const SyncJob& job,
                                     const RunOptions& options) {
    try {
        return execute_steps(ctx, job, options);
    } catch (const std::exception& e) {
        sync_log(fmt::format("orchestrator: run {} aborted: {}", ctx.run_id, e.what()));
        emit(ctx, SyncEvent::error(e.what()));
        return finish(ctx, OutcomeKind::Failure, fmt::format("Sync aborted: {}", e.what()));
    }
}

RunOutcome SyncOrchestrator::execute_steps(RunContext& ctx, const SyncJob& job,
                                           const RunOptions& options) {
    if (recorder_) recorder_->begin(ctx.run_id, ctx.job_name, ctx.dry_run);

    std::vector<SyncSpec> plan;
    for (const auto& spec : job.transfers) {
        for (auto& pass : expand_directions(spec)) {
            plan.push_back(std::move(pass));
        }
    }

    ctx.total_units = static_cast<int>(plan.size());
    if (job.repo_pull_enabled) ctx.total_units++;
    if (job.post_script_enabled) ctx.total_units++;

    sync_log(fmt::format("orchestrator: run {} job '{}' transfers={} units={} dry_run={}",
                         ctx.run_id, ctx.job_name, plan.size(), ctx.total_units, ctx.dry_run));
    emit(ctx, SyncEvent::status(fmt::format("Starting {} '{}' ({} transfer{})",
                                            ctx.dry_run ? "dry run" : "sync", ctx.job_name,
                                            plan.size(), plan.size() == 1 ? "" : "s")));
    emit(ctx, SyncEvent::progress(0));

    // ── Preconditions
    bool need_vpn = false;
    bool need_smb = false;
    for (const auto& spec : plan) {
        need_vpn = need_vpn || spec_requires_vpn(spec);
        need_smb = need_smb || spec_requires_smb(spec);
    }

    if (need_vpn || need_smb) {
        set_state(RunState::EnsuringConnections);
        emit(ctx, SyncEvent::status("Checking network connections..."));
        auto r = probe_.ensure(need_vpn, need_smb, options.credentials, *ctx.cancel,
                               [&](const std::string& msg) { emit(ctx, SyncEvent::status(msg)); });
        if (ctx.cancel->cancelled()) {
            return finish(ctx, OutcomeKind::Cancelled, "Sync cancelled before any transfer");
        }
        if (!r.success) {
            emit(ctx, SyncEvent::error(r.message));
            return finish(ctx, OutcomeKind::Failure, r.message);
        }
    }

    // ── Transfers
    set_state(RunState::Transferring);
    for (size_t i = 0; i < plan.size(); ++i) {
        if (ctx.cancel->cancelled()) break;

        const auto& spec = plan[i];
        std::string label = fmt::format("{} of {}", i + 1, plan.size());
        emit(ctx, SyncEvent::status(fmt::format("Transferring {}: {} -> {}", label,
                                                spec.source.path, spec.destination.path)));

        auto on_event = [&](const SyncEvent& e) {
            if (e.kind == EventKind::Progress) {
                emit_progress(ctx, e.percent / 100.0, fmt::format("Transferring {}", label));
            } else {
                emit(ctx, e);
            }
        };

        TransferResult tr;
        try {
            tr = driver_.transfer(spec, ctx.dry_run, on_event, *ctx.cancel);
        } catch (const ValidationError& e) {
            tr.status = TransferStatus::Failure;
            tr.error = ErrorKind::Validation;
            tr.message = e.what();
        }
        ctx.sources.push_back({spec.source.path, spec.destination.path, tr});

        if (tr.cancelled()) break;
        if (tr.ok()) {
            emit(ctx, {EventKind::Complete, fmt::format("Synced {}", spec.source.path), -1});
        } else {
            emit(ctx, SyncEvent::error(fmt::format("Failed to sync {}: {}",
                                                   spec.source.path, tr.message)));
        }
        complete_unit(ctx, fmt::format("Finished transfer {}", label));
    }
    if (ctx.cancel->cancelled()) {
        return finish(ctx, OutcomeKind::Cancelled, "Sync cancelled");
    }

    // ── Dependent steps
    if (job.repo_pull_enabled) {
        set_state(RunState::RepoSync);
        run_repo_step(ctx, job);
        if (ctx.cancel->cancelled()) {
            return finish(ctx, OutcomeKind::Cancelled, "Sync cancelled");
        }
        complete_unit(ctx, "Repository step finished");
    }

    if (job.post_script_enabled) {
        set_state(RunState::PostScript);
        run_script_step(ctx, job);
        if (ctx.cancel->cancelled()) {
            return finish(ctx, OutcomeKind::Cancelled, "Sync cancelled");
        }
        complete_unit(ctx, "Post-sync script finished");
    }

    return summarize(ctx);
}

void SyncOrchestrator::run_repo_step(RunContext& ctx, const SyncJob& job) {
    if (job.repo_path.empty()) {
        ctx.warnings.push_back("Repository pull is enabled but no repository path is set");
        emit(ctx, SyncEvent::error(ctx.warnings.back()));
        return;
    }
    if (ctx.dry_run) {
        emit(ctx, SyncEvent::status("Skipping repository pull (dry run)"));
        return;
    }

    emit(ctx, SyncEvent::status(fmt::format("Pulling repository {}", job.repo_path)));
    auto r = run_repo_pull(runner_, job.repo_path, *ctx.cancel,
                           [&](const SyncEvent& e) { emit(ctx, e); });
    if (r.cancelled) return;
    if (r.ok) {
        ctx.post_step_succeeded = true;
        emit(ctx, {EventKind::Complete, r.message, -1});
    } else {
        ctx.warnings.push_back(r.message);
        emit(ctx, SyncEvent::error(r.message));
    }
}

void SyncOrchestrator::run_script_step(RunContext& ctx, const SyncJob& job) {
    if (job.post_script_path.empty()) {
        ctx.warnings.push_back("Post-sync script is enabled but no script path is set");
        emit(ctx, SyncEvent::error(ctx.warnings.back()));
        return;
    }
    if (ctx.dry_run) {
        emit(ctx, SyncEvent::status("Skipping post-sync script (dry run)"));
        return;
    }

    emit(ctx, SyncEvent::status(fmt::format("Running {}", job.post_script_path)));
    auto r = run_post_script(runner_, job.post_script_path, *ctx.cancel,
                             [&](const SyncEvent& e) { emit(ctx, e); });
    if (r.cancelled) return;
    if (r.ok) {
        ctx.post_step_succeeded = true;
        emit(ctx, {EventKind::Complete, r.message, -1});
    } else {
        ctx.warnings.push_back(r.message);
        emit(ctx, SyncEvent::error(r.message));
    }
}

// ── Outcome ─────────────────────────────────────────────────

RunOutcome SyncOrchestrator::summarize(RunContext& ctx) {
    int succeeded = 0;
    int failed = 0;
    for (const auto& s : ctx.sources) {
        if (s.result.ok()) succeeded++;
        else failed++;
    }
    int total = succeeded + failed;
    const char* what = ctx.dry_run ? "Dry run" : "Sync";

    OutcomeKind kind;
    std::string message;
    if (failed == 0) {
        kind = OutcomeKind::Success;
        message = fmt::format("{} completed: {} of {} sources succeeded.", what, succeeded, total);
    } else if (succeeded > 0 || ctx.post_step_succeeded) {
        // Partial failures keep the run successful; the count tells the rest
        kind = OutcomeKind::Success;
        message = fmt::format("{} completed with errors: {} of {} sources failed, {} succeeded.",
                              what, failed, total, succeeded);
    } else {
        kind = OutcomeKind::Failure;
        message = fmt::format("{} failed: {} of {} sources failed.", what, failed, total);
    }

    if (!ctx.warnings.empty()) {
        message += fmt::format(" Warnings: {}.", join(ctx.warnings, "; "));
    }
    return finish(ctx, kind, message);
}

RunOutcome SyncOrchestrator::finish(RunContext& ctx, OutcomeKind kind,
                                    const std::string& message) {
    state_ = RunState::Done;

    RunOutcome outcome;
    outcome.kind = kind;
    outcome.message = message;
    outcome.run_id = ctx.run_id;
    outcome.completed_units = ctx.completed_units;
    outcome.total_units = ctx.total_units;
    outcome.sources = ctx.sources;
    outcome.warnings = ctx.warnings;
    for (const auto& s : ctx.sources) {
        if (s.result.ok()) outcome.sources_succeeded++;
        else outcome.sources_failed++;
    }

    // Terminal event, always at 100 so progress bars close
    ctx.last_percent = 100;
    outcome.final_percent = 100;

    RunSummary summary;
    summary.run_id = ctx.run_id;
    summary.job_name = ctx.job_name;
    summary.started_at = ctx.started_at;
    summary.finished_at = now_iso();
    summary.outcome = to_string(kind);
    summary.message = message;
    summary.sources_succeeded = outcome.sources_succeeded;
    summary.sources_failed = outcome.sources_failed;
    summary.dry_run = ctx.dry_run;
    summary.warnings = ctx.warnings;
    if (recorder_) {
        summary.log_path = recorder_->log_path().string();
        recorder_->finish(summary);
    }
    if (history_) history_->append(summary);

    sync_log(fmt::format("orchestrator: run {} {}: {}", ctx.run_id, to_string(kind), message));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_outcome_ = outcome;
    }
    // Last event; active() is false by the time a consumer sees it
    active_ = false;
    emit(ctx, {EventKind::Done, message, 100});
    return outcome;
}
