#include "../credentials.hpp"
#include <fstream>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

// Read all key=value pairs from the credentials file
std::map<std::string, std::string> CredentialManager::read_all() const {
    std::map<std::string, std::string> m;
    std::ifstream f(path_);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

// Write all key=value pairs (chmod 600 on POSIX)
bool CredentialManager::write_all(const std::map<std::string, std::string>& m) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);

    std::ofstream f(path_, std::ios::trunc);
    if (!f) return false;

    for (const auto& [k, v] : m) {
        f << k << "=" << v << "\n";
    }
    f.close();

#ifndef _WIN32
    chmod(path_.c_str(), 0600);
#endif
    return true;
}

Result<std::string> CredentialManager::get_impl(const std::string& key) {
    auto m = read_all();
    auto it = m.find(key);
    if (it == m.end()) {
        return Result<std::string>::Err("Credential not found");
    }
    return Result<std::string>::Ok(it->second);
}

Result<void> CredentialManager::set_impl(const std::string& key, const std::string& value) {
    if (key.find('=') != std::string::npos || key.find('\n') != std::string::npos ||
        value.find('\n') != std::string::npos) {
        return Result<void>::Err("Credential keys and values must be single-line");
    }
    auto m = read_all();
    m[key] = value;
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write credentials file");
    }
    return Result<void>::Ok();
}

Result<void> CredentialManager::remove_impl(const std::string& key) {
    auto m = read_all();
    if (m.erase(key) == 0) {
        return Result<void>::Err("Credential not found");
    }
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write credentials file");
    }
    return Result<void>::Ok();
}
