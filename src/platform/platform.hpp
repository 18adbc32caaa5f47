#pragma once

#include <string>
#include <filesystem>

namespace platform {

enum class HostOS { Linux, MacOS, Windows };

// The operating system this binary was built for.
HostOS host_os();
const char* host_os_name(HostOS os);

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Resolve a program name against PATH. Names containing a separator are
// returned unchanged if they are executable. Empty result = not found.
std::string find_executable(const std::string& program);

// True for a regular file the current user may execute.
bool is_executable(const std::filesystem::path& path);

// True if path is the root of a mounted filesystem (its device differs from
// its parent's). Always false on Windows.
bool is_mount_point(const std::filesystem::path& path);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
