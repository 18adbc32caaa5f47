#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include "types.hpp"

// Keys used for the VPN / share login.
constexpr const char* CRED_USER     = "user";
constexpr const char* CRED_PASSWORD = "password";

struct CredentialInfo {
    std::string key;
    bool has_value;
};

// Credentials stored as key=value lines in ~/.sharesync/credentials (mode 600).
// The sync engine never reads this; the CLI hands it a Credentials value.
class CredentialManager {
public:
    static CredentialManager& instance();

    explicit CredentialManager(std::filesystem::path path);

    // Get credential by key
    Result<std::string> get(const std::string& key);

    // Set credential
    Result<void> set(const std::string& key, const std::string& value);

    // Remove credential
    Result<void> remove(const std::string& key);

    // List all stored credentials
    std::vector<CredentialInfo> list();

    // The login handed to connect/mount. Err if no user is stored.
    Result<Credentials> load_login();
    Result<void> store_login(const Credentials& creds);

    const std::filesystem::path& path() const { return path_; }

private:
    // Storage backend
    std::map<std::string, std::string> read_all() const;
    bool write_all(const std::map<std::string, std::string>& m) const;

    Result<std::string> get_impl(const std::string& key);
    Result<void> set_impl(const std::string& key, const std::string& value);
    Result<void> remove_impl(const std::string& key);

    std::filesystem::path path_;
};
