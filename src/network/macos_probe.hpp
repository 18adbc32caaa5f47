#pragma once

#include "system_probe.hpp"

// openconnect for the tunnel, mount_smbfs for the share.
class MacConnectionProbe : public SystemConnectionProbe {
public:
    MacConnectionProbe(NetworkSettings settings, platform::ProcessRunner& runner);

    bool check_share_mounted() override;
    ConnectionResult connect_vpn(const Credentials& creds, const CancelToken& cancel) override;
    ConnectionResult mount_share(const Credentials& creds) override;
    ConnectionResult disconnect_vpn(const CancelToken& cancel) override;
    ConnectionResult unmount_share() override;

    const char* platform_name() const override { return "macos"; }

    // Percent-encode for the user:password part of an smb:// URL.
    static std::string url_encode(const std::string& s);

protected:
    std::vector<std::string> ping_args(const std::string& host) const override;
};
