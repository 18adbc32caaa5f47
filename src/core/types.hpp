#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Sync model ──────────────────────────────────────────────

enum class SyncMode {
    Mirror,     // exact copy, delete extraneous files at the destination
    Update,     // only replace files that are newer at the source
    Additive,   // only add new files, never delete or overwrite
};

enum class SyncDirection {
    LocalToRemote,
    RemoteToLocal,
    Bidirectional,  // executed as two one-way passes with swapped ends
};

struct SyncLocation {
    std::string path;
    std::string name;
    bool is_remote = false;
    bool requires_vpn = false;      // only meaningful when is_remote
    bool requires_smb = false;      // only meaningful when is_remote
    std::optional<std::string> mount_point;

    bool needs_vpn() const { return is_remote && requires_vpn; }
    bool needs_smb() const { return is_remote && requires_smb; }
};

struct SyncRule {
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    bool exclude_hidden = true;
    std::optional<int64_t> min_file_size;        // bytes
    std::optional<int64_t> max_file_size;        // bytes
    std::vector<std::string> file_extensions;    // e.g. ".pdf", case-sensitive
};

struct SyncSpec {
    SyncLocation source;
    SyncLocation destination;
    SyncMode mode = SyncMode::Update;
    SyncDirection direction = SyncDirection::RemoteToLocal;
    SyncRule rules;
    bool preserve_permissions = true;
    bool preserve_timestamps = true;
    bool follow_symlinks = false;
    int retry_count = 3;
    std::optional<int> bandwidth_limit_kbs;
};

// One configured sync job: every source is transferred in order, then the
// optional dependent steps run.
struct SyncJob {
    std::string name;
    std::vector<SyncSpec> transfers;

    bool repo_pull_enabled = false;
    std::string repo_path;

    bool post_script_enabled = false;
    std::string post_script_path;
};

// Opaque values handed to connect/mount operations. Never persisted by the engine.
struct Credentials {
    std::string username;
    std::string password;
};

// ── Network settings ────────────────────────────────────────

struct NetworkSettings {
    std::string vpn_host;
    std::string vpn_protocol;
    std::vector<std::string> check_hosts;   // internal names that only resolve inside the VPN
    std::string share_host;
    std::string share_path;                 // share name on the host, e.g. "data"
    std::string mount_point;
};

const char* to_string(SyncMode mode);
const char* to_string(SyncDirection direction);
std::optional<SyncMode> parse_sync_mode(const std::string& s);
std::optional<SyncDirection> parse_sync_direction(const std::string& s);

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
