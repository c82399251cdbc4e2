#include "glob.hpp"
#include "util.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <unordered_set>

namespace toolhost {

namespace {

bool has_magic(const std::string& segment) {
    return segment.find_first_of("*?[\\") != std::string::npos;
}

// Split on '/', dropping empty and "." segments
std::vector<std::string> pattern_segments(const std::string& pattern) {
    std::vector<std::string> out;
    for (auto& seg : split(pattern, '/')) {
        if (seg.empty() || seg == ".") continue;
        out.push_back(std::move(seg));
    }
    return out;
}

bool match_segments(const std::vector<std::string>& pat, size_t pi,
                    const std::vector<std::string>& parts, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi + 1 < pat.size() && pat[pi + 1] == "**") ++pi;
            if (pi + 1 == pat.size()) return si < parts.size();
            for (size_t k = si; k <= parts.size(); ++k) {
                if (match_segments(pat, pi + 1, parts, k)) return true;
            }
            return false;
        }
        if (si >= parts.size()) return false;
        if (fnmatch(pat[pi].c_str(), parts[si].c_str(), 0) != 0) return false;
        ++pi;
        ++si;
    }
    return si == parts.size();
}

void walk(const std::filesystem::path& base, const std::string& pattern,
          std::unordered_set<std::string>& seen, std::vector<GlobMatch>& out) {
    auto segs = pattern_segments(pattern);
    if (segs.empty()) return;

    bool absolute = pattern[0] == '/';
    std::filesystem::path root = absolute ? std::filesystem::path("/") : base;
    std::string prefix = absolute ? "/" : "";

    // Literal leading segments narrow the walk instead of being matched
    size_t lit = 0;
    while (lit + 1 < segs.size() && !has_magic(segs[lit]) && segs[lit] != "**") {
        root /= segs[lit];
        if (!prefix.empty() && prefix.back() != '/') prefix += '/';
        prefix += segs[lit];
        ++lit;
    }
    std::vector<std::string> rest(segs.begin() + static_cast<std::ptrdiff_t>(lit), segs.end());
    bool deep = std::find(rest.begin(), rest.end(), "**") != rest.end();
    size_t max_depth = rest.size() - 1;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) return;

    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;

        if (!deep && static_cast<size_t>(it.depth()) >= max_depth) {
            it.disable_recursion_pending();
        }
        if (!entry.is_regular_file(entry_ec)) continue;

        std::vector<std::string> parts;
        for (const auto& p : entry.path().lexically_relative(root)) {
            parts.push_back(p.string());
        }
        if (!match_segments(rest, 0, parts, 0)) continue;

        std::string rel = join(parts, "/");
        std::string path;
        if (prefix.empty()) {
            path = rel;
        } else if (prefix.back() == '/') {
            path = prefix + rel;
        } else {
            path = prefix + "/" + rel;
        }
        if (!seen.insert(path).second) continue;

        auto mtime = entry.last_write_time(entry_ec);
        out.push_back(GlobMatch{path, entry_ec ? std::filesystem::file_time_type::min() : mtime});
    }
}

} // namespace

std::vector<std::string> expand_braces(const std::string& pattern) {
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            ++i;
            continue;
        }
        if (pattern[i] != '{') continue;

        int depth = 0;
        std::vector<size_t> commas;
        size_t close = std::string::npos;
        for (size_t j = i; j < pattern.size(); ++j) {
            char c = pattern[j];
            if (c == '\\') {
                ++j;
            } else if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    close = j;
                    break;
                }
            } else if (c == ',' && depth == 1) {
                commas.push_back(j);
            }
        }
        if (close == std::string::npos) break; // unbalanced: rest is literal
        if (commas.empty()) continue;          // "{a}" is literal

        std::string prefix = pattern.substr(0, i);
        std::string suffix = pattern.substr(close + 1);
        std::vector<std::string> results;
        size_t start = i + 1;
        commas.push_back(close);
        for (size_t c : commas) {
            std::string alt = pattern.substr(start, c - start);
            for (auto& expanded : expand_braces(prefix + alt + suffix)) {
                if (std::find(results.begin(), results.end(), expanded) == results.end()) {
                    results.push_back(std::move(expanded));
                }
            }
            start = c + 1;
        }
        return results;
    }
    return {pattern};
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(pattern_segments(pattern), 0, pattern_segments(path), 0);
}

std::vector<GlobMatch> glob_files(const std::filesystem::path& base, const std::string& pattern) {
    std::vector<GlobMatch> matches;
    std::unordered_set<std::string> seen;
    for (const auto& expanded : expand_braces(pattern)) {
        walk(base, expanded, seen, matches);
    }

    std::sort(matches.begin(), matches.end(), [](const GlobMatch& a, const GlobMatch& b) {
        if (a.mtime != b.mtime) return a.mtime > b.mtime;
        return a.path < b.path;
    });
    return matches;
}

} // namespace toolhost
