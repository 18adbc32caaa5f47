#include "linux_probe.hpp"
#include <sync/sync_log.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#ifndef _WIN32
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

LinuxConnectionProbe::LinuxConnectionProbe(NetworkSettings settings,
                                           platform::ProcessRunner& runner,
                                           std::string mounts_file)
    : SystemConnectionProbe(std::move(settings), runner),
      mounts_file_(std::move(mounts_file)) {}

std::vector<std::string> LinuxConnectionProbe::ping_args(const std::string& host) const {
    return {"-c", "1", "-W", "1", host};
}

// /proc/mounts escapes blanks in paths as octal (\040)
static std::string unescape_mount_field(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 3 < s.size()) {
            std::string oct = s.substr(i + 1, 3);
            if (oct.find_first_not_of("01234567") == std::string::npos) {
                out += static_cast<char>(std::stoi(oct, nullptr, 8));
                i += 3;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

bool LinuxConnectionProbe::check_share_mounted() {
    if (settings_.share_host.empty()) return false;

    std::ifstream in(mounts_file_);
    if (!in) return false;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string device, mount_point;
        if (!(fields >> device >> mount_point)) continue;
        if (device.find(settings_.share_host) == std::string::npos) continue;
        if (!settings_.mount_point.empty() &&
            unescape_mount_field(mount_point) != settings_.mount_point) continue;
        return true;
    }
    return false;
}

ConnectionResult LinuxConnectionProbe::connect_vpn(const Credentials& creds, const CancelToken& cancel) {
    return connect_openconnect(creds, cancel);
}

ConnectionResult LinuxConnectionProbe::disconnect_vpn(const CancelToken& cancel) {
    return disconnect_openconnect(cancel);
}

ConnectionResult LinuxConnectionProbe::mount_share(const Credentials& creds) {
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
    if (!fs::is_directory(settings_.mount_point, ec)) {
        fs::create_directories(settings_.mount_point, ec);
        if (ec) {
            auto mk = run("sudo", {"-n", "mkdir", "-p", settings_.mount_point});
            if (mk.failed()) {
                return ConnectionResult::Err(ConnectionError::CommandFailed,
                    fmt::format("Cannot create mount point {}: {}", settings_.mount_point,
                                first_line(mk.stderr_data)));
            }
        }
    }

    std::string options = "username=" + creds.username;
#ifndef _WIN32
    options += fmt::format(",uid={},gid={}", getuid(), getgid());
#endif

    // mount.cifs reads the password from PASSWD, keeping it off the command line
    platform::ProcessOptions opts;
    opts.env["PASSWD"] = creds.password;

    std::string remote = fmt::format("//{}/{}", settings_.share_host, settings_.share_path);
    sync_log(fmt::format("probe: mounting {} at {}", remote, settings_.mount_point));
    auto out = run("sudo", {"-n", "--preserve-env=PASSWD", "mount", "-t", "cifs",
                            remote, settings_.mount_point, "-o", options}, opts);
    if (out.failed()) {
        std::string detail = first_line(out.stderr_data);
        if (detail.empty()) detail = fmt::format("mount exited with code {}", out.exit_code);
        return ConnectionResult::Err(classify_failure(detail), detail);
    }
    return ConnectionResult::Ok(fmt::format("Mounted {} at {}", remote, settings_.mount_point));
}

ConnectionResult LinuxConnectionProbe::unmount_share() {
    if (!check_share_mounted()) return ConnectionResult::Ok("Share not mounted");

    auto out = run("sudo", {"-n", "umount", settings_.mount_point});
    if (out.failed()) {
        return ConnectionResult::Err(ConnectionError::CommandFailed,
                                     "umount failed: " + first_line(out.stderr_data));
    }
    return ConnectionResult::Ok(fmt::format("Unmounted {}", settings_.mount_point));
}
