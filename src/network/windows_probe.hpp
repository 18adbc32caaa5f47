#pragma once

#include "system_probe.hpp"

// The tunnel is left to the user's VPN client; the share is mapped with `net use`.
class WindowsConnectionProbe : public SystemConnectionProbe {
public:
    WindowsConnectionProbe(NetworkSettings settings, platform::ProcessRunner& runner);

    bool check_share_mounted() override;
    ConnectionResult connect_vpn(const Credentials& creds, const CancelToken& cancel) override;
    ConnectionResult mount_share(const Credentials& creds) override;
    ConnectionResult disconnect_vpn(const CancelToken& cancel) override;
    ConnectionResult unmount_share() override;

    const char* platform_name() const override { return "windows"; }

    // Drive letter ("X:") the share is mapped to, empty if not mapped.
    std::string mapped_drive();

protected:
    std::vector<std::string> ping_args(const std::string& host) const override;

private:
    std::string unc_path() const;
    std::string free_drive_letter() const;
};
