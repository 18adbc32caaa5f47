#include "windows_probe.hpp"
#include <sync/sync_log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

WindowsConnectionProbe::WindowsConnectionProbe(NetworkSettings settings,
                                               platform::ProcessRunner& runner)
    : SystemConnectionProbe(std::move(settings), runner) {}

std::vector<std::string> WindowsConnectionProbe::ping_args(const std::string& host) const {
    return {"-n", "1", "-w", "1000", host};
}

std::string WindowsConnectionProbe::unc_path() const {
    return fmt::format("\\\\{}\\{}", settings_.share_host, settings_.share_path);
}

// `net use` lists one mapping per line: "OK  Z:  \\host\share  Microsoft Windows Network"
std::string WindowsConnectionProbe::mapped_drive() {
    if (settings_.share_host.empty()) return "";

    auto out = run("net", {"use"});
    if (out.failed()) return "";

    std::string host = lower(settings_.share_host);
    std::istringstream in(out.stdout_data);
    std::string line;
    while (std::getline(in, line)) {
        if (lower(line).find(host) == std::string::npos) continue;
        std::istringstream fields(line);
        std::string tok;
        while (fields >> tok) {
            if (tok.size() == 2 && tok[1] == ':' && std::isalpha(static_cast<unsigned char>(tok[0]))) {
                return tok;
            }
        }
        return "";
    }
    return "";
}

bool WindowsConnectionProbe::check_share_mounted() {
    return !mapped_drive().empty();
}

std::string WindowsConnectionProbe::free_drive_letter() const {
    for (char c = 'E'; c <= 'Z'; ++c) {
        std::error_code ec;
        if (!fs::exists(std::string(1, c) + ":\\", ec)) return std::string(1, c) + ":";
    }
    return "";
}

ConnectionResult WindowsConnectionProbe::connect_vpn(const Credentials&, const CancelToken&) {
    if (check_vpn()) return ConnectionResult::Ok("VPN already connected");
    return ConnectionResult::Err(ConnectionError::Unsupported,
        "automatic connection is not supported on Windows; start your VPN client first");
}

ConnectionResult WindowsConnectionProbe::disconnect_vpn(const CancelToken&) {
    if (!check_vpn()) return ConnectionResult::Ok("VPN not connected");
    return ConnectionResult::Err(ConnectionError::Unsupported,
        "automatic disconnection is not supported on Windows; use your VPN client");
}

ConnectionResult WindowsConnectionProbe::mount_share(const Credentials& creds) {
    if (check_share_mounted()) return ConnectionResult::Ok("Share already mapped");
    if (!check_vpn()) {
        return ConnectionResult::Err(ConnectionError::VPNRequired,
                                     "VPN must be connected before mapping the share");
    }
    if (creds.username.empty()) {
        return ConnectionResult::Err(ConnectionError::AuthFailed,
                                     "No share credentials stored. Run 'sharesync setup'.");
    }

    std::string drive = settings_.mount_point.empty() ? free_drive_letter()
                                                      : settings_.mount_point;
    if (drive.empty()) {
        return ConnectionResult::Err(ConnectionError::CommandFailed, "No free drive letter");
    }

    sync_log(fmt::format("probe: net use {} {}", drive, unc_path()));
    auto out = run("net", {"use", drive, unc_path(), "/user:" + creds.username,
                           creds.password, "/persistent:no"});
    if (out.failed()) {
        std::string detail = first_line(out.stderr_data.empty() ? out.stdout_data
                                                                : out.stderr_data);
        if (detail.empty()) detail = fmt::format("net use exited with code {}", out.exit_code);
        return ConnectionResult::Err(classify_failure(detail), detail);
    }
    return ConnectionResult::Ok(fmt::format("Mapped {} to {}", unc_path(), drive));
}

ConnectionResult WindowsConnectionProbe::unmount_share() {
    std::string drive = mapped_drive();
    if (drive.empty()) return ConnectionResult::Ok("Share not mapped");

    auto out = run("net", {"use", drive, "/delete", "/y"});
    if (out.failed()) {
        return ConnectionResult::Err(ConnectionError::CommandFailed,
                                     "net use /delete failed: " + first_line(out.stderr_data));
    }
    return ConnectionResult::Ok(fmt::format("Removed mapping {}", drive));
}
