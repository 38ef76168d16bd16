#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <cstdint>

// Identifier for this machine in machine_metadata.
// PM_MACHINE_ID, then HOSTNAME, then gethostname(), then "<user>@unknown".
std::string get_machine_id();

// Current UTC time as YYYY-MM-DDTHH:MM:SS.mmmZ.
std::string now_iso();

// Parse an ISO 8601 timestamp (UTC, optional fraction and 'Z') to time_t.
// Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Milliseconds since the epoch, for ordering timestamps that differ in
// fractional precision. 0 on failure.
int64_t iso_millis(const std::string& iso);

// True if the string has the timestamp shape produced by now_iso()
// (fraction and 'Z' optional).
bool is_iso_timestamp(const std::string& s);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Read a non-empty environment variable.
std::string env_or(const char* name, const std::string& fallback = "");

// Lowercase hex SHA-256 of a file's contents. Empty string on read failure.
std::string compute_file_sha256(const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Split on a delimiter, dropping empty pieces.
std::vector<std::string> split(const std::string& str, char delimiter);
