#pragma once

#include <string>
#include <cstdint>

// Format the duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses current time (for runs still in flight).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Same rendering for a plain number of seconds.
std::string format_seconds(int64_t seconds);

// Format an ISO timestamp to "Mon 14 2:35pm". Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);

// Human-readable byte count: "512 B", "1.50 KB", "3.20 GB".
std::string format_bytes(uint64_t bytes);
