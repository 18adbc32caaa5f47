#include "credentials.hpp"
#include <platform/platform.hpp>

CredentialManager& CredentialManager::instance() {
    static CredentialManager mgr(platform::home_dir() / ".sharesync" / "credentials");
    return mgr;
}

CredentialManager::CredentialManager(std::filesystem::path path) : path_(std::move(path)) {}

Result<std::string> CredentialManager::get(const std::string& key) {
    return get_impl(key);
}

Result<void> CredentialManager::set(const std::string& key, const std::string& value) {
    return set_impl(key, value);
}

Result<void> CredentialManager::remove(const std::string& key) {
    return remove_impl(key);
}

std::vector<CredentialInfo> CredentialManager::list() {
    std::vector<CredentialInfo> infos;
    for (const auto& [k, v] : read_all()) {
        infos.push_back({k, !v.empty()});
    }
    return infos;
}

Result<Credentials> CredentialManager::load_login() {
    auto user = get(CRED_USER);
    if (user.is_err() || user.value.empty()) {
        return Result<Credentials>::Err("No username stored. Run 'sharesync setup'.");
    }
    Credentials creds;
    creds.username = user.value;
    auto pass = get(CRED_PASSWORD);
    if (pass.is_ok()) creds.password = pass.value;
    return Result<Credentials>::Ok(creds);
}

Result<void> CredentialManager::store_login(const Credentials& creds) {
    auto r = set(CRED_USER, creds.username);
    if (r.is_err()) return r;
    return set(CRED_PASSWORD, creds.password);
}
