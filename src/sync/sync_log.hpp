#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <platform/platform.hpp>

inline std::string sync_log_path() {
    static std::string path = (platform::temp_dir() / "sharesync_debug.log").string();
    return path;
}

// Persistent run log directory: ~/.sharesync/logs
inline std::filesystem::path run_log_dir() {
    return platform::home_dir() / ".sharesync" / "logs";
}

// Debug trace shared by every component. Best effort: a missing temp dir
// must never break a sync.
inline void sync_log(const std::string& msg) {
    std::ofstream out(sync_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}
