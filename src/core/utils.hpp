#pragma once

#include <string>
#include <ctime>
#include <filesystem>

// Generate an ISO 8601 UTC timestamp with milliseconds
// (YYYY-MM-DDTHH:MM:SS.mmmZ) for the current time.
std::string now_iso();

// Parse an ISO 8601 UTC timestamp to time_t. Fractional seconds and the
// trailing Z are optional. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// URL-safe random identifier (21 chars by default).
std::string generate_id(size_t length = 21);

// Standard base64 (with padding), used for inline image payloads.
std::string base64_encode(const std::string& input);

// Read a whole file as bytes. Throws StoreError when it cannot be opened.
std::string read_file_bytes(const std::filesystem::path& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
