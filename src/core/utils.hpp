#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Format a unix time as ISO 8601 local time.
std::string format_iso(std::time_t t);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Split on a single character, dropping empty pieces.
std::vector<std::string> split(const std::string& s, char sep);

// Nanoseconds since the unix epoch (session id suffix).
int64_t unix_nanos();

// Human-readable byte count: 512B, 1.5K, 20.0M.
std::string format_bytes(uint64_t n);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
