#pragma once

#include "system_probe.hpp"

// openconnect for the tunnel, mount.cifs for the share.
class LinuxConnectionProbe : public SystemConnectionProbe {
public:
    LinuxConnectionProbe(NetworkSettings settings, platform::ProcessRunner& runner,
                         std::string mounts_file = "/proc/mounts");

    bool check_share_mounted() override;
    ConnectionResult connect_vpn(const Credentials& creds, const CancelToken& cancel) override;
    ConnectionResult mount_share(const Credentials& creds) override;
    ConnectionResult disconnect_vpn(const CancelToken& cancel) override;
    ConnectionResult unmount_share() override;

    const char* platform_name() const override { return "linux"; }

protected:
    std::vector<std::string> ping_args(const std::string& host) const override;

private:
    std::string mounts_file_;
};
