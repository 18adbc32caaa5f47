#pragma once

#include <memory>
#include <string>
#include <core/cancel_token.hpp>
#include <core/types.hpp>

namespace platform { class ProcessRunner; }

enum class ConnectionError {
    None,
    VPNRequired,    // share mount attempted without a tunnel
    AuthFailed,
    Unsupported,    // this host cannot do it automatically
    CommandFailed,
    Timeout,
    Cancelled,
};

struct ConnectionResult {
    bool success = false;
    ConnectionError error = ConnectionError::None;
    std::string message;

    static ConnectionResult Ok(std::string msg) {
        return {true, ConnectionError::None, std::move(msg)};
    }
    static ConnectionResult Err(ConnectionError err, std::string msg) {
        return {false, err, std::move(msg)};
    }
};

struct ConnectionStatus {
    bool vpn_connected = false;
    bool share_mounted = false;
};

// Queries and actions for the VPN tunnel and the mounted share.
// One implementation per host OS, picked by make_connection_probe().
//
// check_vpn() is a heuristic: an internal host name resolving (or the share
// host answering a ping) is taken as proof the tunnel is up.
class ConnectionProbe {
public:
    virtual ~ConnectionProbe() = default;

    virtual bool check_vpn() = 0;
    virtual bool check_share_mounted() = 0;

    // All four are idempotent: a no-op success when already in the target state.
    // The tunnel calls wait for the tunnel to settle and give up early
    // (ConnectionError::Cancelled) once cancel is set.
    virtual ConnectionResult connect_vpn(const Credentials& creds, const CancelToken& cancel) = 0;
    virtual ConnectionResult mount_share(const Credentials& creds) = 0;
    virtual ConnectionResult disconnect_vpn(const CancelToken& cancel) = 0;
    virtual ConnectionResult unmount_share() = 0;

    virtual const char* platform_name() const = 0;

    // Bring up what a run needs: the tunnel first, then the share.
    // A failure message always names "VPN" or "share". Checks cancel before
    // every step.
    ConnectionResult ensure(bool require_vpn, bool require_smb, const Credentials& creds,
                            const CancelToken& cancel, const StatusCallback& cb);

    ConnectionStatus status();
};

std::unique_ptr<ConnectionProbe> make_connection_probe(const NetworkSettings& settings,
                                                       platform::ProcessRunner& runner);
