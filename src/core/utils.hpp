#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include "types.hpp"

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Same, for an arbitrary wall-clock point.
std::string to_iso(std::chrono::system_clock::time_point tp);

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Session names are used as registry keys and in log lines:
// non-empty, no spaces, no '@'.
Result<void> validate_session_name(const std::string& name);

// Printable rendering of raw terminal bytes for log lines (\r, \n, \x1b escaped).
std::string escape_bytes(const std::string& data, std::size_t max_len = 200);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
