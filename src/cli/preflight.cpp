#include "preflight.hpp"
#include <core/credentials.hpp>
#include <platform/platform.hpp>
#include <sync/transfer_command.hpp>
#include <filesystem>
#include <fmt/format.h>

std::vector<PreflightIssue> check_credentials(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& profile = config.profile();
    if (!profile.requires_vpn && !profile.requires_smb) return issues;

    auto& creds = CredentialManager::instance();

    auto user = creds.get(CRED_USER);
    if (user.is_err() || user.value.empty()) {
        issues.push_back({"No username configured", "Run 'sharesync setup'"});
    }

    auto pass = creds.get(CRED_PASSWORD);
    if (pass.is_err() || pass.value.empty()) {
        issues.push_back({"No password stored; connecting may prompt or fail",
                          "Run 'sharesync setup'", true});
    }

    return issues;
}

std::vector<PreflightIssue> check_network_settings(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& net = config.network();
    const auto& profile = config.profile();

    if (!global_config_exists()) {
        issues.push_back({
            "Global config not found at " + get_global_config_path().string(),
            "Run 'sharesync setup' to write one with the default network settings",
            true
        });
    }

    if (profile.requires_vpn && net.vpn_host.empty()) {
        issues.push_back({"VPN host not configured",
                          "Set network.vpn_host in " + get_global_config_path().string()});
    }
    if (profile.requires_smb && net.share_host.empty()) {
        issues.push_back({"Share host not configured",
                          "Set network.share_host in " + get_global_config_path().string()});
    }

    return issues;
}

std::vector<PreflightIssue> check_profile(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& profile = config.profile();

    if (profile.sources.empty()) {
        issues.push_back({"Profile lists no sources", "Add a 'sources:' list to the profile"});
    }
    if (profile.destination.empty()) {
        issues.push_back({"Profile has no destination", "Set 'destination:' in the profile"});
    }

    if (profile.repo_pull_enabled && !profile.repo_path.empty() &&
        !fs::is_directory(fs::path(expand_home(profile.repo_path)) / ".git")) {
        issues.push_back({
            fmt::format("Repository pull enabled but {} is not a git checkout", profile.repo_path),
            "Fix repo_pull.path or disable the step",
            true
        });
    }

    if (profile.post_script_enabled && !profile.post_script_path.empty() &&
        !fs::exists(expand_home(profile.post_script_path))) {
        issues.push_back({
            fmt::format("Post-sync script '{}' not found", profile.post_script_path),
            "Fix post_script.path or disable the step",
            true
        });
    }

    return issues;
}

std::vector<PreflightIssue> check_copy_tool() {
    std::vector<PreflightIssue> issues;
    const char* program = tool_program(default_copy_tool());
    if (platform::find_executable(program).empty()) {
        issues.push_back({fmt::format("'{}' not found on PATH", program),
                          fmt::format("Install {} and try again", program)});
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const Config& config) {
    std::vector<PreflightIssue> all;

    // A broken profile makes the remaining checks meaningless
    auto profile_issues = check_profile(config);
    all.insert(all.end(), profile_issues.begin(), profile_issues.end());
    for (const auto& issue : all) {
        if (!issue.is_hint) return all;
    }

    auto tool_issues = check_copy_tool();
    all.insert(all.end(), tool_issues.begin(), tool_issues.end());

    auto net_issues = check_network_settings(config);
    all.insert(all.end(), net_issues.begin(), net_issues.end());

    auto cred_issues = check_credentials(config);
    all.insert(all.end(), cred_issues.begin(), cred_issues.end());

    return all;
}
