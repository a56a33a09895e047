#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace chatmem {

// ISO 8601 timestamp
std::string timestamp_now();

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Cut to at most max_bytes without splitting a UTF-8 sequence
std::string utf8_truncate(const std::string& s, size_t max_bytes);

// Shorten for display: first `limit` bytes + "..." when longer
std::string preview(const std::string& s, size_t limit);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename; creates the parent directory if needed
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace chatmem
