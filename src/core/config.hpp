#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Defaults applied to every profile that does not set them.
struct SyncDefaults {
    int retry_count = 3;
    std::optional<int> bandwidth_limit_kbs;
};

// A job profile as written in sharesync.yaml.
struct ProfileConfig {
    std::string name;
    std::string destination;
    std::vector<std::string> sources;

    SyncMode mode = SyncMode::Update;
    SyncDirection direction = SyncDirection::RemoteToLocal;
    bool requires_vpn = true;           // for the remote side
    bool requires_smb = true;

    SyncRule rules;
    bool preserve_permissions = true;
    bool preserve_timestamps = true;
    bool follow_symlinks = false;
    std::optional<int> retry_count;             // falls back to SyncDefaults
    std::optional<int> bandwidth_limit_kbs;

    bool repo_pull_enabled = false;
    std::string repo_path;
    bool post_script_enabled = false;
    std::string post_script_path;
};

class Config {
public:
    // Load global config from ~/.sharesync/config.yaml
    static Result<Config> load_global();

    // Load a job profile (sharesync.yaml)
    static Result<Config> load_profile(const fs::path& path);

    // Global settings plus the profile; a missing global file means defaults
    static Result<Config> load(const fs::path& profile_path);

    const NetworkSettings& network() const { return network_; }
    const SyncDefaults& defaults() const { return defaults_; }
    const ProfileConfig& profile() const { return profile_; }
    const fs::path& profile_path() const { return profile_path_; }

public:
    Config();

private:
    NetworkSettings network_;
    SyncDefaults defaults_;
    ProfileConfig profile_;
    fs::path profile_path_;
};

// Helper to check if configs exist
bool global_config_exists();
bool profile_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_profile_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();

// Expand a leading "~" to the home directory.
std::string expand_home(const std::string& path);

// Build the engine's job: one transfer per source into destination/<source name>.
SyncJob build_sync_job(const Config& config);

// Convert the old INI-style config.txt into a profile. Refuses to overwrite.
Result<fs::path> migrate_legacy_config(const fs::path& legacy_path, const fs::path& profile_path);

// Write a profile file.
Result<void> save_profile(const ProfileConfig& profile, const fs::path& path);
