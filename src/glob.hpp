#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace toolhost {

// Glob engine used by the Glob tool. Supports "*", "?", "[...]" and
// backslash escapes within a path segment (fnmatch), "**" across any
// number of segments, and "{a,b}" alternation. Leading dots are matched
// like any other character.

struct GlobMatch {
    std::string path; // relative to the search base, '/'-separated
    std::filesystem::file_time_type mtime;
};

// Expand "{a,b}" alternations (nested allowed). Unbalanced braces are literal.
std::vector<std::string> expand_braces(const std::string& pattern);

// Match a '/'-separated relative path against a brace-free pattern.
bool glob_match(const std::string& pattern, const std::string& path);

// Regular files under base matching pattern, sorted by mtime descending
// (ties by path). Directory symlinks are not descended into.
std::vector<GlobMatch> glob_files(const std::filesystem::path& base, const std::string& pattern);

} // namespace toolhost
