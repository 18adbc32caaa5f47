#include "errors.hpp"
#include <fmt/format.h>

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::Validation:        return "validation";
        case ErrorKind::Launch:            return "launch";
        case ErrorKind::TransientTransfer: return "transient-transfer";
        case ErrorKind::FatalTransfer:     return "fatal-transfer";
        case ErrorKind::Precondition:      return "precondition";
        case ErrorKind::VPNRequired:       return "vpn-required";
        case ErrorKind::Cancelled:         return "cancelled";
    }
    return "unknown";
}

static std::string join_violations(const std::vector<std::string>& violations) {
    std::string out;
    for (const auto& v : violations) {
        if (!out.empty()) out += "; ";
        out += v;
    }
    return out;
}

ValidationError::ValidationError(std::vector<std::string> violations)
    : SyncError(ErrorKind::Validation,
                "Sync spec validation failed: " + join_violations(violations)),
      violations_(std::move(violations)) {}

LaunchError::LaunchError(const std::string& program, const std::string& reason)
    : SyncError(ErrorKind::Launch, fmt::format("Cannot launch '{}': {}", program, reason)),
      program_(program) {}
