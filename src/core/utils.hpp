#pragma once

#include <string>
#include <vector>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Compact identifier for a run: YYYYMMDD_HHMMSS_<4 hex>.
std::string make_run_id();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Join with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Split on a single character, trimming each piece and dropping empty ones.
std::vector<std::string> split_trimmed(const std::string& s, char sep);

// Render a command line for logs: arguments with spaces are quoted.
std::string format_command(const std::string& program, const std::vector<std::string>& args);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
