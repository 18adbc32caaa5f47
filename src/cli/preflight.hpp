#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Runs all checks a foreground run needs before it starts.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const Config& config);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_credentials(const Config& config);
std::vector<PreflightIssue> check_network_settings(const Config& config);
std::vector<PreflightIssue> check_profile(const Config& config);
std::vector<PreflightIssue> check_copy_tool();
