#pragma once
#include <string>
#include <chrono>
#include <cstdint>

namespace spindles {

// ISO 8601 UTC timestamp with millisecond precision
std::string timestamp_now();

// Format a wall-clock time point as ISO 8601 UTC with milliseconds
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Timestamp safe for file names: ':' and '.' replaced by '-'
std::string filename_timestamp(std::chrono::system_clock::time_point tp);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Case-insensitive ASCII equality
bool iequals(const std::string& a, const std::string& b);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Create parent directories of a file path. Returns false on failure.
bool ensure_parent_dir(const std::string& file_path);

// Write via temp file + rename. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// First n bytes of s without splitting a UTF-8 sequence
std::string utf8_prefix(const std::string& s, size_t n);

} // namespace spindles
