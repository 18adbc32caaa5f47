#include "transfer_driver.hpp"
#include "sync_log.hpp"
#include <core/constants.hpp>
#include <core/sync_spec.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace fs = std::filesystem;

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Success:   return "success";
        case TransferStatus::Failure:   return "failure";
        case TransferStatus::Cancelled: return "cancelled";
    }
    return "failure";
}

static void emit(const EventCallback& cb, SyncEvent event) {
    if (cb) cb(event);
}

static TransferResult make_result(TransferStatus status, ErrorKind error,
                                  std::string message, int attempts, int exit_code) {
    TransferResult r;
    r.status = status;
    r.error = error;
    r.message = std::move(message);
    r.attempts = attempts;
    r.exit_code = exit_code;
    return r;
}

TransferDriver::TransferDriver(platform::ProcessRunner& runner, CopyTool tool)
    : runner_(runner), tool_(tool), backoff_(RETRY_BACKOFF_MS) {}

// ── Transfer ────────────────────────────────────────────────

TransferResult TransferDriver::transfer(const SyncSpec& spec, bool dry_run,
                                        const EventCallback& on_event,
                                        const CancelToken& cancel) {
    require_valid(spec);

    std::error_code ec;
    if (!spec.source.is_remote && !fs::exists(spec.source.path, ec)) {
        return make_result(TransferStatus::Failure, ErrorKind::FatalTransfer,
                           fmt::format("Source does not exist: {}", spec.source.path), 0, -1);
    }

    if (!dry_run && !spec.destination.is_remote) {
        fs::create_directories(spec.destination.path, ec);
        if (ec) {
            return make_result(TransferStatus::Failure, ErrorKind::FatalTransfer,
                               fmt::format("Cannot create destination {}: {}",
                                           spec.destination.path, ec.message()), 0, -1);
        }
    }

    TransferCommand cmd = build_transfer_command(spec, dry_run, tool_);
    for (const auto& note : cmd.notes) {
        emit(on_event, SyncEvent::status(note));
    }

    const int max_attempts = spec.retry_count + 1;
    ProgressParser parser(tool_);
    std::unique_ptr<platform::ProcessHandle> handle;
    std::chrono::steady_clock::time_point resume_at;
    std::string last_error;
    int attempts = 0;
    int retries_used = 0;
    TransferResult result;

    Phase phase = Phase::Launch;
    while (phase != Phase::Finished) {
        switch (phase) {
        case Phase::Launch: {
            if (cancel.cancelled()) {
                result = make_result(TransferStatus::Cancelled, ErrorKind::Cancelled,
                                     "Transfer cancelled", attempts, PROCESS_EXIT_CANCELLED);
                phase = Phase::Finished;
                break;
            }
            ++attempts;
            parser.reset();
            last_error.clear();
            sync_log(fmt::format("transfer: attempt {}/{}: {}", attempts, max_attempts,
                                 format_command(cmd.program, cmd.args)));
            try {
                handle = runner_.run(cmd.program, cmd.args, {});
            } catch (const LaunchError& e) {
                sync_log(fmt::format("transfer: launch failed: {}", e.what()));
                result = make_result(TransferStatus::Failure, ErrorKind::Launch,
                                     e.what(), attempts, -1);
                phase = Phase::Finished;
                break;
            }
            phase = Phase::Streaming;
            break;
        }

        case Phase::Streaming: {
            int code = stream_attempt(*handle, parser, on_event, cancel, last_error);
            handle.reset();

            if (code == PROCESS_EXIT_CANCELLED || cancel.cancelled()) {
                result = make_result(TransferStatus::Cancelled, ErrorKind::Cancelled,
                                     "Transfer cancelled", attempts, PROCESS_EXIT_CANCELLED);
                phase = Phase::Finished;
                break;
            }

            ExitClass cls = classify_exit(tool_, code);
            if (cls == ExitClass::Success) {
                result = make_result(TransferStatus::Success, ErrorKind::None,
                                     dry_run ? "Dry run completed" : "Transfer completed",
                                     attempts, code);
                phase = Phase::Finished;
            } else if (cls == ExitClass::Transient && retries_used < spec.retry_count) {
                ++retries_used;
                emit(on_event, SyncEvent::status(fmt::format(
                    "{} {}, retrying in {} ms (retry {} of {})",
                    tool_program(tool_), describe_exit(tool_, code),
                    backoff_.count(), retries_used, spec.retry_count)));
                resume_at = std::chrono::steady_clock::now() + backoff_;
                phase = Phase::Backoff;
            } else if (cls == ExitClass::Transient) {
                result = make_result(TransferStatus::Failure, ErrorKind::FatalTransfer,
                                     fmt::format("Transfer failed after {} attempts ({})",
                                                 attempts, describe_exit(tool_, code)),
                                     attempts, code);
                phase = Phase::Finished;
            } else {
                std::string msg = fmt::format("{} failed: {}", tool_program(tool_),
                                              describe_exit(tool_, code));
                if (!last_error.empty()) msg += " (" + last_error + ")";
                result = make_result(TransferStatus::Failure, ErrorKind::FatalTransfer,
                                     msg, attempts, code);
                phase = Phase::Finished;
            }
            break;
        }

        case Phase::Backoff:
            if (cancel.wait_until(resume_at)) {
                result = make_result(TransferStatus::Cancelled, ErrorKind::Cancelled,
                                     "Transfer cancelled", attempts, PROCESS_EXIT_CANCELLED);
                phase = Phase::Finished;
            } else {
                phase = Phase::Launch;
            }
            break;

        case Phase::Finished:
            break;
        }
    }

    sync_log(fmt::format("transfer: {} after {} attempt(s): {}",
                         to_string(result.status), result.attempts, result.message));
    return result;
}

// ── Streaming ───────────────────────────────────────────────

int TransferDriver::stream_attempt(platform::ProcessHandle& handle, ProgressParser& parser,
                                   const EventCallback& on_event, const CancelToken& cancel,
                                   std::string& last_error) {
    platform::OutputLine line;
    while (true) {
        if (cancel.cancelled()) {
            handle.cancel();
            break;
        }

        auto status = handle.next_line(line, PROCESS_POLL_MS);
        if (status == platform::ReadStatus::Closed) break;
        if (status == platform::ReadStatus::Timeout) continue;

        if (line.stream == platform::OutputStream::Stderr) {
            last_error = line.text;
            emit(on_event, SyncEvent::error(line.text));
            continue;
        }

        ParsedLine parsed = parser.parse(line.text);
        switch (parsed.kind) {
            case LineKind::Progress:
                emit(on_event, SyncEvent::progress(parsed.percent));
                break;
            case LineKind::Text:
                emit(on_event, SyncEvent::status(line.text));
                break;
            case LineKind::Ignored:
                break;
        }
    }
    return handle.wait();
}
