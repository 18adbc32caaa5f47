#include "system_probe.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <platform/net_util.hpp>
#include <sync/sync_log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>

SystemConnectionProbe::SystemConnectionProbe(NetworkSettings settings,
                                             platform::ProcessRunner& runner)
    : settings_(std::move(settings)), runner_(runner) {}

// ── Helpers ─────────────────────────────────────────────────

platform::CapturedOutput SystemConnectionProbe::run(const std::string& program,
                                                    const std::vector<std::string>& args,
                                                    const platform::ProcessOptions& options) {
    try {
        return platform::run_captured(runner_, program, args, options);
    } catch (const LaunchError& e) {
        sync_log(fmt::format("probe: {}", e.what()));
        platform::CapturedOutput out;
        out.exit_code = -1;
        out.stderr_data = e.what();
        return out;
    }
}

ConnectionError SystemConnectionProbe::classify_failure(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const char* auth_markers[] = {
        "auth", "password", "permission denied", "logon failure", "access is denied",
        "login failed",
    };
    for (const char* m : auth_markers) {
        if (lower.find(m) != std::string::npos) return ConnectionError::AuthFailed;
    }
    return ConnectionError::CommandFailed;
}

std::string SystemConnectionProbe::first_line(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = text.find_first_of("\r\n", start);
    return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

bool SystemConnectionProbe::wait_for_vpn(bool want_up, int timeout_ms, const CancelToken& cancel) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!cancel.cancelled()) {
        if (check_vpn() == want_up) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        if (cancel.wait_for(std::chrono::milliseconds(VPN_ESTABLISH_POLL_MS))) break;
    }
    return false;
}

// ── VPN ─────────────────────────────────────────────────────

bool SystemConnectionProbe::check_vpn() {
    for (const auto& host : settings_.check_hosts) {
        if (platform::resolve_host(host)) return true;
    }
    if (settings_.share_host.empty()) return false;

    auto out = run("ping", ping_args(settings_.share_host));
    return out.success();
}

ConnectionResult SystemConnectionProbe::connect_openconnect(const Credentials& creds,
                                                            const CancelToken& cancel) {
    if (cancel.cancelled()) {
        return ConnectionResult::Err(ConnectionError::Cancelled, "VPN connection cancelled");
    }
    if (check_vpn()) return ConnectionResult::Ok("VPN already connected");

    if (settings_.vpn_host.empty()) {
        return ConnectionResult::Err(ConnectionError::CommandFailed, "No VPN host configured");
    }
    if (creds.username.empty() || creds.password.empty()) {
        return ConnectionResult::Err(ConnectionError::AuthFailed,
                                     "No VPN credentials stored. Run 'sharesync setup'.");
    }

    std::vector<std::string> args = {
        "-n", "openconnect",
        "--protocol=" + settings_.vpn_protocol,
        "--user", creds.username,
        "--passwd-on-stdin",
        "--background",
        settings_.vpn_host,
    };
    platform::ProcessOptions opts;
    opts.stdin_data = creds.password + "\n";

    sync_log(fmt::format("probe: openconnect to {} as {}", settings_.vpn_host, creds.username));
    auto out = run("sudo", args, opts);
    if (out.failed()) {
        std::string detail = first_line(out.stderr_data.empty() ? out.stdout_data : out.stderr_data);
        if (detail.empty()) detail = fmt::format("openconnect exited with code {}", out.exit_code);
        return ConnectionResult::Err(classify_failure(detail), detail);
    }

    if (!wait_for_vpn(true, VPN_ESTABLISH_WAIT_SECS * 1000, cancel)) {
        if (cancel.cancelled()) {
            // openconnect is already backgrounded; it keeps trying on its own
            return ConnectionResult::Err(ConnectionError::Cancelled,
                                         "VPN connection cancelled while the tunnel was coming up");
        }
        return ConnectionResult::Err(ConnectionError::Timeout,
            fmt::format("tunnel to {} did not come up within {} seconds",
                        settings_.vpn_host, VPN_ESTABLISH_WAIT_SECS));
    }
    return ConnectionResult::Ok(fmt::format("Connected to VPN {}", settings_.vpn_host));
}

ConnectionResult SystemConnectionProbe::disconnect_openconnect(const CancelToken& cancel) {
    if (cancel.cancelled()) {
        return ConnectionResult::Err(ConnectionError::Cancelled, "VPN disconnect cancelled");
    }
    if (!check_vpn()) return ConnectionResult::Ok("VPN not connected");

    auto out = run("sudo", {"-n", "pkill", "-x", "openconnect"});
    if (out.failed()) {
        // pkill exits 1 when nothing matched: the tunnel is not ours to close
        if (out.exit_code == 1) {
            return ConnectionResult::Err(ConnectionError::CommandFailed,
                                         "VPN is up but not managed by openconnect");
        }
        return ConnectionResult::Err(classify_failure(out.stderr_data),
                                     "Failed to stop openconnect: " + first_line(out.stderr_data));
    }

    if (!wait_for_vpn(false, VPN_ESTABLISH_WAIT_SECS * 1000, cancel)) {
        if (cancel.cancelled()) {
            return ConnectionResult::Err(ConnectionError::Cancelled,
                                         "VPN disconnect cancelled while the tunnel was closing");
        }
        return ConnectionResult::Err(ConnectionError::Timeout, "VPN still reachable after disconnect");
    }
    return ConnectionResult::Ok("VPN disconnected");
}
