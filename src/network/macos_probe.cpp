#include "macos_probe.hpp"
#include <platform/platform.hpp>
#include <sync/sync_log.hpp>
#include <fmt/format.h>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

MacConnectionProbe::MacConnectionProbe(NetworkSettings settings, platform::ProcessRunner& runner)
    : SystemConnectionProbe(std::move(settings), runner) {}

std::vector<std::string> MacConnectionProbe::ping_args(const std::string& host) const {
    return {"-c", "1", "-t", "1", host};
}

std::string MacConnectionProbe::url_encode(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

bool MacConnectionProbe::check_share_mounted() {
    if (settings_.mount_point.empty()) return false;
    return platform::is_mount_point(settings_.mount_point);
}

ConnectionResult MacConnectionProbe::connect_vpn(const Credentials& creds, const CancelToken& cancel) {
    return connect_openconnect(creds, cancel);
}

ConnectionResult MacConnectionProbe::disconnect_vpn(const CancelToken& cancel) {
    return disconnect_openconnect(cancel);
}

ConnectionResult MacConnectionProbe::mount_share(const Credentials& creds) {
    if (check_share_mounted()) return ConnectionResult::Ok("Share already mounted");
    if (!check_vpn()) {
        return ConnectionResult::Err(ConnectionError::VPNRequired,
                                     "VPN must be connected before mounting the share");
    }
    if (settings_.mount_point.empty()) {
        return ConnectionResult::Err(ConnectionError::CommandFailed, "No mount point configured");
    }
    if (creds.username.empty()) {
        return ConnectionResult::Err(ConnectionError::AuthFailed,
                                     "No share credentials stored. Run 'sharesync setup'.");
    }

    std::error_code ec;
    fs::create_directories(settings_.mount_point, ec);
    if (ec) {
        return ConnectionResult::Err(ConnectionError::CommandFailed,
            fmt::format("Cannot create mount point {}: {}", settings_.mount_point, ec.message()));
    }

    std::string url = fmt::format("//{}:{}@{}/{}", url_encode(creds.username),
                                  url_encode(creds.password),
                                  settings_.share_host, settings_.share_path);
    sync_log(fmt::format("probe: mount_smbfs //{}/{} at {}", settings_.share_host,
                         settings_.share_path, settings_.mount_point));
    auto out = run("mount_smbfs", {url, settings_.mount_point});
    if (out.failed()) {
        std::string detail = first_line(out.stderr_data);
        if (detail.empty()) detail = fmt::format("mount_smbfs exited with code {}", out.exit_code);
        return ConnectionResult::Err(classify_failure(detail), detail);
    }
    return ConnectionResult::Ok(fmt::format("Mounted //{}/{} at {}", settings_.share_host,
                                            settings_.share_path, settings_.mount_point));
}

ConnectionResult MacConnectionProbe::unmount_share() {
    if (!check_share_mounted()) return ConnectionResult::Ok("Share not mounted");

    auto out = run("umount", {settings_.mount_point});
    if (out.failed()) {
        return ConnectionResult::Err(ConnectionError::CommandFailed,
                                     "umount failed: " + first_line(out.stderr_data));
    }
    return ConnectionResult::Ok(fmt::format("Unmounted {}", settings_.mount_point));
}
