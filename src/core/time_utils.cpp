#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <ctime>
#include <sstream>
#include <iomanip>

// Cross-platform ISO timestamp parsing (YYYY-MM-DDTHH:MM:SS)
static bool parse_iso(const std::string& s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    out->tm_isdst = -1;
    return !ss.fail();
}

std::string format_seconds(int64_t seconds) {
    if (seconds < 0) seconds = 0;
    int64_t hours = seconds / 3600;
    int64_t mins = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    }
    return fmt::format("{}s", secs);
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    struct tm start_tm = {};
    if (!parse_iso(start_time, &start_tm)) return "?";
    std::time_t start_t = mktime(&start_tm);

    std::time_t end_t = std::time(nullptr);
    if (!end_time.empty()) {
        struct tm end_tm = {};
        if (!parse_iso(end_time, &end_tm)) return "?";
        end_t = mktime(&end_tm);
    }

    return format_seconds(static_cast<int64_t>(std::difftime(end_t, start_t)));
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    struct tm tm_buf = {};
    if (!parse_iso(iso_time, &tm_buf)) return "?";

    char day[16];
    std::strftime(day, sizeof(day), "%b %d", &tm_buf);
    char clock[16];
    std::strftime(clock, sizeof(clock), "%I:%M%p", &tm_buf);

    // "08:13PM" -> "8:13pm"
    std::string c(clock);
    if (!c.empty() && c[0] == '0') c.erase(0, 1);
    for (auto& ch : c) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return fmt::format("{} {}", day, c);
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    if (bytes < 1024) return fmt::format("{} B", bytes);

    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}
