#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <sys/types.h>

namespace maxproxy {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Lowercase ASCII copy
std::string to_lower(const std::string& s);

// Join strings with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Generate a simple unique ID (hex). Safe to call from multiple threads.
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to path via a temp file + rename, creating parent
// directories as needed. The file is created with the given mode.
bool atomic_write_file(const std::string& path, const std::string& content,
                       mode_t mode = 0644);

} // namespace maxproxy
