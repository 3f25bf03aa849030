#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace memora {

// Unix epoch milliseconds
uint64_t epoch_millis();

// UTC timestamp with millisecond precision: 2026-01-31T08:15:00.250Z
// Lexicographic order matches chronological order.
std::string format_timestamp(uint64_t epoch_ms);

// Inverse of format_timestamp. Also accepts a value without the fractional part.
std::optional<uint64_t> parse_timestamp(const std::string& s);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Lowercase alphanumeric words, in order of appearance
std::vector<std::string> tokenize(const std::string& s);

// Number of non-overlapping occurrences of needle in haystack
size_t count_occurrences(const std::string& haystack, const std::string& needle);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to path.tmp then rename over path. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace memora
