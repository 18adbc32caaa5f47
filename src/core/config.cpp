#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

Config::Config() {
    network_.vpn_host = DEFAULT_VPN_HOST;
    network_.vpn_protocol = DEFAULT_VPN_PROTOCOL;
    network_.check_hosts = {DEFAULT_CHECK_HOST};
    network_.share_host = DEFAULT_SHARE_HOST;
    network_.share_path = DEFAULT_SHARE_PATH;
    network_.mount_point = DEFAULT_MOUNT_POINT;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool profile_exists(const fs::path& dir) {
    return fs::exists(get_profile_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sharesync";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_profile_path(const fs::path& dir) {
    return dir / PROFILE_FILE_NAME;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/' && path[1] != '\\') return path;
    return (platform::home_dir() / path.substr(path.size() > 1 ? 2 : 1)).string();
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    std::string default_config = fmt::format(R"(# sharesync global configuration
# Network settings shared by every profile

network:
  vpn_host: "{}"
  vpn_protocol: "{}"             # openconnect --protocol
  check_hosts:                           # names that only resolve inside the VPN
    - "{}"
  share_host: "{}"
  share_path: "{}"
  mount_point: "{}"

# Used when a profile does not set them
defaults:
  retry_count: {}
  # bandwidth_limit: 5000                # KB/s, rsync only
)", DEFAULT_VPN_HOST, DEFAULT_VPN_PROTOCOL, DEFAULT_CHECK_HOST, DEFAULT_SHARE_HOST,
    DEFAULT_SHARE_PATH, DEFAULT_MOUNT_POINT, DEFAULT_RETRY_COUNT);

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

// ── Parsing ─────────────────────────────────────────────────

static std::vector<std::string> string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& n : node) out.push_back(n.as<std::string>());
    }
    return out;
}

static std::optional<int64_t> optional_size(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<int64_t>();
}

static std::optional<int> optional_int(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<int>();
}

static void parse_network(const YAML::Node& node, NetworkSettings& net) {
    net.vpn_host = node["vpn_host"].as<std::string>(net.vpn_host);
    net.vpn_protocol = node["vpn_protocol"].as<std::string>(net.vpn_protocol);
    if (node["check_hosts"]) net.check_hosts = string_list(node["check_hosts"]);
    net.share_host = node["share_host"].as<std::string>(net.share_host);
    net.share_path = node["share_path"].as<std::string>(net.share_path);
    net.mount_point = expand_home(node["mount_point"].as<std::string>(net.mount_point));
}

static SyncRule parse_rules(const YAML::Node& node) {
    SyncRule rules;
    if (!node || !node.IsMap()) return rules;
    rules.include_patterns = string_list(node["include"]);
    rules.exclude_patterns = string_list(node["exclude"]);
    rules.exclude_hidden = node["exclude_hidden"].as<bool>(true);
    rules.min_file_size = optional_size(node["min_size"]);
    rules.max_file_size = optional_size(node["max_size"]);
    rules.file_extensions = string_list(node["extensions"]);
    return rules;
}

static Result<ProfileConfig> parse_profile(const YAML::Node& root) {
    ProfileConfig p;
    p.name = root["name"].as<std::string>("");
    p.destination = expand_home(root["destination"].as<std::string>(""));
    for (const auto& s : string_list(root["sources"])) {
        p.sources.push_back(expand_home(s));
    }

    if (root["mode"]) {
        auto m = parse_sync_mode(root["mode"].as<std::string>());
        if (!m) return Result<ProfileConfig>::Err("Unknown sync mode: " + root["mode"].as<std::string>());
        p.mode = *m;
    }
    if (root["direction"]) {
        auto d = parse_sync_direction(root["direction"].as<std::string>());
        if (!d) return Result<ProfileConfig>::Err("Unknown direction: " + root["direction"].as<std::string>());
        p.direction = *d;
    }

    p.requires_vpn = root["requires_vpn"].as<bool>(true);
    p.requires_smb = root["requires_smb"].as<bool>(true);
    p.rules = parse_rules(root["rules"]);
    p.preserve_permissions = root["preserve_permissions"].as<bool>(true);
    p.preserve_timestamps = root["preserve_timestamps"].as<bool>(true);
    p.follow_symlinks = root["follow_symlinks"].as<bool>(false);
    p.retry_count = optional_int(root["retry_count"]);
    p.bandwidth_limit_kbs = optional_int(root["bandwidth_limit"]);

    if (root["repo_pull"] && root["repo_pull"].IsMap()) {
        const auto& n = root["repo_pull"];
        p.repo_path = expand_home(n["path"].as<std::string>(""));
        p.repo_pull_enabled = n["enabled"].as<bool>(!p.repo_path.empty());
    }
    if (root["post_script"] && root["post_script"].IsMap()) {
        const auto& n = root["post_script"];
        p.post_script_path = expand_home(n["path"].as<std::string>(""));
        p.post_script_enabled = n["enabled"].as<bool>(!p.post_script_path.empty());
    }

    return Result<ProfileConfig>::Ok(p);
}

// ── Loading ─────────────────────────────────────────────────

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }

    try {
        YAML::Node root = YAML::LoadFile(get_global_config_path().string());

        Config config;
        if (root["network"] && root["network"].IsMap()) {
            parse_network(root["network"], config.network_);
        }
        if (root["defaults"] && root["defaults"].IsMap()) {
            const auto& d = root["defaults"];
            config.defaults_.retry_count = d["retry_count"].as<int>(DEFAULT_RETRY_COUNT);
            config.defaults_.bandwidth_limit_kbs = optional_int(d["bandwidth_limit"]);
        }
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse global config: ") + e.what());
    }
}

Result<Config> Config::load_profile(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Profile not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        auto profile = parse_profile(root);
        if (profile.is_err()) {
            return Result<Config>::Err(path.string() + ": " + profile.error);
        }

        Config config;
        config.profile_ = profile.value;
        config.profile_path_ = path;

        // Auto-infer the profile name from its directory
        if (config.profile_.name.empty()) {
            config.profile_.name = fs::absolute(path).parent_path().filename().string();
        }
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse profile: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& profile_path) {
    Config config;
    if (global_config_exists()) {
        auto global_result = load_global();
        if (!global_result.is_ok()) {
            return global_result;
        }
        config = global_result.value;
    }

    auto profile_result = load_profile(profile_path);
    if (!profile_result.is_ok()) {
        return profile_result;
    }
    config.profile_ = profile_result.value.profile_;
    config.profile_path_ = profile_path;
    return Result<Config>::Ok(config);
}

// ── Job building ────────────────────────────────────────────

SyncJob build_sync_job(const Config& config) {
    const auto& p = config.profile();
    const auto& net = config.network();

    SyncJob job;
    job.name = p.name;
    job.repo_pull_enabled = p.repo_pull_enabled;
    job.repo_path = p.repo_path;
    job.post_script_enabled = p.post_script_enabled;
    job.post_script_path = p.post_script_path;

    bool remote_source = p.direction != SyncDirection::LocalToRemote;

    for (const auto& src : p.sources) {
        std::string trimmed = src;
        while (trimmed.size() > 1 && (trimmed.back() == '/' || trimmed.back() == '\\')) {
            trimmed.pop_back();
        }
        std::string folder = fs::path(trimmed).filename().string();

        SyncSpec spec;
        spec.source.path = trimmed;
        spec.source.name = folder;
        spec.destination.path = p.destination.empty()
            ? "" : (fs::path(p.destination) / folder).string();
        spec.destination.name = folder;

        SyncLocation& remote = remote_source ? spec.source : spec.destination;
        remote.is_remote = true;
        remote.requires_vpn = p.requires_vpn;
        remote.requires_smb = p.requires_smb;
        if (!net.mount_point.empty()) remote.mount_point = net.mount_point;

        spec.mode = p.mode;
        spec.direction = p.direction;
        spec.rules = p.rules;
        spec.preserve_permissions = p.preserve_permissions;
        spec.preserve_timestamps = p.preserve_timestamps;
        spec.follow_symlinks = p.follow_symlinks;
        spec.retry_count = p.retry_count.value_or(config.defaults().retry_count);
        spec.bandwidth_limit_kbs = p.bandwidth_limit_kbs ? p.bandwidth_limit_kbs
                                                         : config.defaults().bandwidth_limit_kbs;
        job.transfers.push_back(spec);
    }
    return job;
}

// ── Profiles ────────────────────────────────────────────────

static void emit_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& v) {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& s : v) out << s;
    out << YAML::EndSeq;
}

Result<void> save_profile(const ProfileConfig& p, const fs::path& path) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << p.name;
    out << YAML::Key << "destination" << YAML::Value << p.destination;
    emit_list(out, "sources", p.sources);
    out << YAML::Key << "mode" << YAML::Value << to_string(p.mode);
    out << YAML::Key << "direction" << YAML::Value << to_string(p.direction);
    out << YAML::Key << "requires_vpn" << YAML::Value << p.requires_vpn;
    out << YAML::Key << "requires_smb" << YAML::Value << p.requires_smb;
    if (p.retry_count) out << YAML::Key << "retry_count" << YAML::Value << *p.retry_count;
    if (p.bandwidth_limit_kbs) out << YAML::Key << "bandwidth_limit" << YAML::Value << *p.bandwidth_limit_kbs;
    out << YAML::Key << "preserve_permissions" << YAML::Value << p.preserve_permissions;
    out << YAML::Key << "preserve_timestamps" << YAML::Value << p.preserve_timestamps;
    out << YAML::Key << "follow_symlinks" << YAML::Value << p.follow_symlinks;

    out << YAML::Key << "rules" << YAML::Value << YAML::BeginMap;
    emit_list(out, "include", p.rules.include_patterns);
    emit_list(out, "exclude", p.rules.exclude_patterns);
    out << YAML::Key << "exclude_hidden" << YAML::Value << p.rules.exclude_hidden;
    if (p.rules.min_file_size) out << YAML::Key << "min_size" << YAML::Value << *p.rules.min_file_size;
    if (p.rules.max_file_size) out << YAML::Key << "max_size" << YAML::Value << *p.rules.max_file_size;
    emit_list(out, "extensions", p.rules.file_extensions);
    out << YAML::EndMap;

    out << YAML::Key << "repo_pull" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << p.repo_pull_enabled;
    out << YAML::Key << "path" << YAML::Value << p.repo_path;
    out << YAML::EndMap;

    out << YAML::Key << "post_script" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << p.post_script_enabled;
    out << YAML::Key << "path" << YAML::Value << p.post_script_path;
    out << YAML::EndMap;
    out << YAML::EndMap;

    std::ofstream f(path);
    if (!f) {
        return Result<void>::Err("Failed to write profile at " + path.string());
    }
    f << out.c_str() << "\n";
    return Result<void>::Ok();
}

// ── Legacy migration ────────────────────────────────────────

static bool parse_flag(std::string v, bool fallback) {
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    return fallback;
}

Result<fs::path> migrate_legacy_config(const fs::path& legacy_path, const fs::path& profile_path) {
    if (fs::exists(profile_path)) {
        return Result<fs::path>::Err("Profile already exists at " + profile_path.string());
    }

    std::ifstream in(legacy_path);
    if (!in) {
        return Result<fs::path>::Err("Cannot read " + legacy_path.string());
    }

    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') continue;
        auto sep = line.find_first_of("=:");
        if (sep == std::string::npos) continue;
        std::string key = line.substr(0, sep);
        std::string value = line.substr(sep + 1);
        trim(key);
        trim(value);
        std::transform(key.begin(), key.end(), key.begin(), ::tolower);
        values[key] = value;
    }

    if (values["destination"].empty() || values["source_paths"].empty()) {
        return Result<fs::path>::Err(legacy_path.string() +
                                     " must define destination and source_paths");
    }

    ProfileConfig p;
    p.name = fs::absolute(profile_path).parent_path().filename().string();
    p.destination = values["destination"];
    p.sources = split_trimmed(values["source_paths"], ',');
    // The legacy script ran rsync with --ignore-existing --update
    p.mode = SyncMode::Update;
    p.direction = SyncDirection::RemoteToLocal;
    if (!values["max_rsync_retries"].empty()) {
        p.retry_count = safe_stoi(values["max_rsync_retries"], DEFAULT_RETRY_COUNT);
    }
    p.repo_path = values["oop_repo_path"];
    p.repo_pull_enabled = parse_flag(values["enable_git_pull"], !p.repo_path.empty());
    p.post_script_path = values["swegl_script_path"];
    p.post_script_enabled = parse_flag(values["enable_swegl_script"], !p.post_script_path.empty());

    auto saved = save_profile(p, profile_path);
    if (saved.is_err()) {
        return Result<fs::path>::Err(saved.error);
    }
    return Result<fs::path>::Ok(profile_path);
}
