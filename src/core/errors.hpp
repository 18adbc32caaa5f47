#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Classification used in results that travel back to the caller.
enum class ErrorKind {
    None,
    Validation,         // bad SyncSpec, nothing executed
    Launch,             // external tool missing or unspawnable
    TransientTransfer,  // retryable exit code, recovered internally
    FatalTransfer,      // non-retryable exit code or retries exhausted
    Precondition,       // VPN or mount could not be established
    VPNRequired,        // mount attempted without a VPN tunnel
    Cancelled,          // user request, never retried
};

const char* to_string(ErrorKind kind);

class SyncError : public std::runtime_error {
public:
    SyncError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Raised before anything is executed. Carries every violated invariant.
class ValidationError : public SyncError {
public:
    explicit ValidationError(std::vector<std::string> violations);

    const std::vector<std::string>& violations() const { return violations_; }

private:
    std::vector<std::string> violations_;
};

// Raised by ProcessRunner::run when the program cannot be started.
class LaunchError : public SyncError {
public:
    LaunchError(const std::string& program, const std::string& reason);

    const std::string& program() const { return program_; }

private:
    std::string program_;
};
