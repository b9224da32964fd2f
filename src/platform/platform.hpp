#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Returns a fresh, not-yet-existing path in the temp dir with the given prefix.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// rename(), falling back to copy + remove when source and destination are on
// different filesystems. Throws std::filesystem::filesystem_error.
void move_file(const std::filesystem::path& from, const std::filesystem::path& to);

// Write content to path.tmp and rename it over path, so readers never see a
// partial file. Throws std::runtime_error on failure.
void write_file_atomic(const std::filesystem::path& path, const std::string& content);

} // namespace platform
