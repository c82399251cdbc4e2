#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace toolhost {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter. Every delimiter starts a new part, so a
// trailing delimiter yields a trailing empty part and "" yields {""}.
std::vector<std::string> split(const std::string& s, char delim);

// Join parts with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Simple string replace (all occurrences, non-overlapping, left to right)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Lowercase ASCII letters
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Number of code points in a UTF-8 string. Invalid bytes count as one each.
size_t utf8_length(const std::string& s);

// Keep at most max_chars code points. Never splits a multi-byte sequence.
std::string utf8_truncate(const std::string& s, size_t max_chars);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace toolhost
