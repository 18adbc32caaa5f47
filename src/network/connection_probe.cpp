#include "connection_probe.hpp"
#include "linux_probe.hpp"
#include "macos_probe.hpp"
#include "windows_probe.hpp"
#include <platform/platform.hpp>
#include <sync/sync_log.hpp>
#include <fmt/format.h>

namespace {

ConnectionResult cancelled_result() {
    return ConnectionResult::Err(ConnectionError::Cancelled, "Cancelled while connecting");
}

} // namespace

ConnectionResult ConnectionProbe::ensure(bool require_vpn, bool require_smb, const Credentials& creds,
                                         const CancelToken& cancel, const StatusCallback& cb) {
    auto report = [&](const std::string& msg) { if (cb) cb(msg); };

    // The share is only reachable through the tunnel
    if (require_vpn || require_smb) {
        if (cancel.cancelled()) return cancelled_result();
        if (check_vpn()) {
            report("VPN connection is active");
        } else if (require_vpn) {
            report("Connecting to VPN...");
            auto r = connect_vpn(creds, cancel);
            if (r.error == ConnectionError::Cancelled) return r;
            if (!r.success) {
                sync_log("ensure: VPN failed: " + r.message);
                return ConnectionResult::Err(r.error, "VPN connection failed: " + r.message);
            }
            report(r.message);
        } else {
            return ConnectionResult::Err(ConnectionError::VPNRequired,
                                         "VPN is not connected; the share cannot be reached");
        }
    }

    if (require_smb) {
        if (cancel.cancelled()) return cancelled_result();
        if (check_share_mounted()) {
            report("Network share is mounted");
        } else {
            report("Mounting network share...");
            auto r = mount_share(creds);
            if (cancel.cancelled()) return cancelled_result();
            if (!r.success) {
                sync_log("ensure: mount failed: " + r.message);
                return ConnectionResult::Err(r.error, "Network share mount failed: " + r.message);
            }
            report(r.message);
        }
    }

    return ConnectionResult::Ok("Connections ready");
}

ConnectionStatus ConnectionProbe::status() {
    ConnectionStatus s;
    s.vpn_connected = check_vpn();
    s.share_mounted = check_share_mounted();
    return s;
}

std::unique_ptr<ConnectionProbe> make_connection_probe(const NetworkSettings& settings,
                                                       platform::ProcessRunner& runner) {
    switch (platform::host_os()) {
        case platform::HostOS::MacOS:
            return std::make_unique<MacConnectionProbe>(settings, runner);
        case platform::HostOS::Windows:
            return std::make_unique<WindowsConnectionProbe>(settings, runner);
        case platform::HostOS::Linux:
            break;
    }
    return std::make_unique<LinuxConnectionProbe>(settings, runner);
}
