#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/cancel_token.hpp>
#include <core/types.hpp>
#include <network/connection_probe.hpp>
#include <platform/process.hpp>
#include "run_history.hpp"
#include "run_recorder.hpp"
#include "sync_event.hpp"
#include "transfer_driver.hpp"

enum class RunState {
    Idle,
    EnsuringConnections,
    Transferring,
    RepoSync,
    PostScript,
    Cancelling,
    Done,
};

const char* to_string(RunState state);

enum class OutcomeKind { Success, Failure, Cancelled };

const char* to_string(OutcomeKind kind);

struct SourceResult {
    std::string source;
    std::string destination;
    TransferResult result;
};

struct RunOutcome {
    OutcomeKind kind = OutcomeKind::Failure;
    std::string message;        // one sentence with succeeded/failed counts
    std::string run_id;
    int sources_succeeded = 0;
    int sources_failed = 0;
    int completed_units = 0;
    int total_units = 0;
    int final_percent = 0;
    std::vector<SourceResult> sources;
    std::vector<std::string> warnings;     // soft post-step failures

    bool ok() const { return kind == OutcomeKind::Success; }
};

struct RunOptions {
    bool dry_run = false;
    Credentials credentials;
};

// Per-run bookkeeping, owned by the worker for the lifetime of one run.
struct RunContext {
    std::string run_id;
    std::string job_name;
    std::string started_at;
    bool dry_run = false;

    int completed_units = 0;
    int total_units = 0;
    int last_percent = 0;

    std::shared_ptr<CancelToken> cancel;
    std::vector<SyncEvent> events;
    std::vector<SourceResult> sources;
    std::vector<std::string> warnings;
    bool post_step_succeeded = false;
};

// Drives one sync job at a time: network preconditions, every transfer in
// order, then the repository pull and the post-sync script.
//
// The caller talks to a run only through the event queue (poll_event), the
// optional sink, and cancel(). A second start() while a run is in flight
// is rejected.
class SyncOrchestrator {
public:
    SyncOrchestrator(ConnectionProbe& probe, platform::ProcessRunner& runner,
                     TransferDriver& driver);
    ~SyncOrchestrator();

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    // Run on a worker thread. Throws ValidationError before anything starts;
    // returns an error if another run is active. Ok value is the run id.
    Result<std::string> start(const SyncJob& job, const RunOptions& options);

    // Run on the calling thread. Same validation; throws std::runtime_error
    // if another run is active.
    RunOutcome run(const SyncJob& job, const RunOptions& options);

    // Request cancellation of the active run. No-op when idle.
    void cancel();

    // Join the worker and return the outcome of the last run, if any.
    std::optional<RunOutcome> wait();

    // Pop the next event, waiting up to timeout_ms. False if none arrived.
    bool poll_event(SyncEvent& out, int timeout_ms);

    bool active() const { return active_; }
    RunState state() const { return state_; }
    std::optional<RunOutcome> last_outcome() const;

    // Also deliver every event to this callback (on the worker thread).
    void set_event_sink(EventCallback sink) { sink_ = std::move(sink); }
    void set_recorder(RunRecorder* recorder) { recorder_ = recorder; }
    void set_history(RunHistory* history) { history_ = history; }

    // Every spec in the job must be valid and there must be at least one.
    static void validate_job(const SyncJob& job);

private:
    std::shared_ptr<RunContext> prepare(const SyncJob& job, const RunOptions& options);
    RunOutcome execute(RunContext& ctx, const SyncJob& job, const RunOptions& options);
    RunOutcome execute_steps(RunContext& ctx, const SyncJob& job, const RunOptions& options);

    void emit(RunContext& ctx, SyncEvent event);
    void emit_progress(RunContext& ctx, double step_fraction, const std::string& msg);
    void complete_unit(RunContext& ctx, const std::string& msg);
    // Leaves Cancelling in place; only finish() moves past it.
    void set_state(RunState state);

    void run_repo_step(RunContext& ctx, const SyncJob& job);
    void run_script_step(RunContext& ctx, const SyncJob& job);

    RunOutcome finish(RunContext& ctx, OutcomeKind kind, const std::string& message);
    RunOutcome summarize(RunContext& ctx);

    ConnectionProbe& probe_;
    platform::ProcessRunner& runner_;
    TransferDriver& driver_;
    RunRecorder* recorder_ = nullptr;
    RunHistory* history_ = nullptr;
    EventCallback sink_;
    EventQueue events_;

    std::atomic<bool> active_{false};
    std::atomic<RunState> state_{RunState::Idle};
    std::thread worker_;

    mutable std::mutex mutex_;
    std::shared_ptr<CancelToken> cancel_;
    std::optional<RunOutcome> last_outcome_;
};
