#include "platform.hpp"
#include <cstdlib>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace platform {

HostOS host_os() {
#if defined(_WIN32)
    return HostOS::Windows;
#elif defined(__APPLE__)
    return HostOS::MacOS;
#else
    return HostOS::Linux;
#endif
}

const char* host_os_name(HostOS os) {
    switch (os) {
        case HostOS::Linux:   return "linux";
        case HostOS::MacOS:   return "macos";
        case HostOS::Windows: return "windows";
    }
    return "unknown";
}

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

bool is_executable(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
#ifdef _WIN32
    auto ext = path.extension().string();
    return ext == ".exe" || ext == ".bat" || ext == ".cmd" || ext == ".com";
#else
    return access(path.c_str(), X_OK) == 0;
#endif
}

std::string find_executable(const std::string& program) {
    if (program.empty()) return "";

    if (program.find('/') != std::string::npos || program.find('\\') != std::string::npos) {
        return is_executable(program) ? program : "";
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";

#ifdef _WIN32
    const char sep = ';';
    const char* suffixes[] = {"", ".exe", ".bat", ".cmd", ".com"};
#else
    const char sep = ':';
    const char* suffixes[] = {""};
#endif

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, sep)) {
        if (dir.empty()) dir = ".";
        for (const char* suffix : suffixes) {
            fs::path candidate = fs::path(dir) / (program + suffix);
            if (is_executable(candidate)) return candidate.string();
        }
    }
    return "";
}

bool is_mount_point(const fs::path& path) {
#ifdef _WIN32
    (void)path;
    return false;
#else
    struct stat self;
    struct stat parent;
    if (stat(path.c_str(), &self) != 0) return false;

    fs::path up = path / "..";
    if (stat(up.c_str(), &parent) != 0) return false;

    // "/" is its own parent; a different device means a filesystem boundary
    if (self.st_dev != parent.st_dev) return true;
    return self.st_ino == parent.st_ino;
#endif
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
