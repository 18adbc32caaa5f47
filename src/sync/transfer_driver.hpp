#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/errors.hpp>
#include <platform/process.hpp>
#include <core/cancel_token.hpp>
#include "progress_parser.hpp"
#include "sync_event.hpp"
#include "transfer_command.hpp"

enum class TransferStatus { Success, Failure, Cancelled };

const char* to_string(TransferStatus status);

struct TransferResult {
    TransferStatus status = TransferStatus::Failure;
    ErrorKind error = ErrorKind::None;
    std::string message;
    int attempts = 0;
    int exit_code = -1;

    bool ok() const { return status == TransferStatus::Success; }
    bool cancelled() const { return status == TransferStatus::Cancelled; }
};

// Runs one one-way transfer through the external copy tool, retrying
// transient exits. Progress events carry the percent of this transfer only.
class TransferDriver {
public:
    explicit TransferDriver(platform::ProcessRunner& runner,
                            CopyTool tool = default_copy_tool());

    // Throws ValidationError if the spec is invalid; nothing is executed then.
    // Bidirectional specs must be split with expand_directions() first.
    TransferResult transfer(const SyncSpec& spec, bool dry_run,
                            const EventCallback& on_event,
                            const CancelToken& cancel);

    // Delay between a transient exit and the next attempt.
    void set_retry_backoff(std::chrono::milliseconds backoff) { backoff_ = backoff; }
    CopyTool tool() const { return tool_; }

private:
    enum class Phase { Launch, Streaming, Backoff, Finished };

    // Pump one attempt's output until the process closes or cancel is seen.
    int stream_attempt(platform::ProcessHandle& handle, ProgressParser& parser,
                       const EventCallback& on_event, const CancelToken& cancel,
                       std::string& last_error);

    platform::ProcessRunner& runner_;
    CopyTool tool_;
    std::chrono::milliseconds backoff_;
};
