#pragma once

#include <string>
#include <vector>
#include <platform/process.hpp>
#include "connection_probe.hpp"

// Shared plumbing for the OS probes: everything is done by shelling out
// through the injected ProcessRunner, so tests can script every command.
class SystemConnectionProbe : public ConnectionProbe {
public:
    SystemConnectionProbe(NetworkSettings settings, platform::ProcessRunner& runner);

    bool check_vpn() override;

    const NetworkSettings& settings() const { return settings_; }

protected:
    // Arguments for a single ping with a one second timeout.
    virtual std::vector<std::string> ping_args(const std::string& host) const = 0;

    // Run to completion. A program that cannot be started reads as a
    // failed command (exit -1) with the reason on stderr.
    platform::CapturedOutput run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 const platform::ProcessOptions& options = {});

    // openconnect through sudo, shared by Linux and macOS.
    ConnectionResult connect_openconnect(const Credentials& creds, const CancelToken& cancel);
    ConnectionResult disconnect_openconnect(const CancelToken& cancel);

    // Wait up to timeout_ms for check_vpn() to report the wanted state.
    // False on timeout or as soon as cancel is set.
    bool wait_for_vpn(bool want_up, int timeout_ms, const CancelToken& cancel);

    // AuthFailed if the tool's text looks like a credential problem.
    static ConnectionError classify_failure(const std::string& text);
    static std::string first_line(const std::string& text);

    NetworkSettings settings_;
    platform::ProcessRunner& runner_;
};
