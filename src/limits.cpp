#include "limits.hpp"
#include "util.hpp"

namespace toolhost {

std::string truncate_output(const std::string& text, size_t max_chars) {
    return utf8_truncate(text, max_chars);
}

std::string truncate_with_marker(const std::string& text, const std::string& marker,
                                 size_t max_chars) {
    if (utf8_length(text) <= max_chars) return text;
    size_t marker_len = utf8_length(marker);
    if (marker_len >= max_chars) return utf8_truncate(marker, max_chars);
    return utf8_truncate(text, max_chars - marker_len) + marker;
}

std::vector<std::string> cap_entries(const std::vector<std::string>& items,
                                     size_t max_entries) {
    if (items.size() <= max_entries) return items;
    return std::vector<std::string>(items.begin(),
                                    items.begin() + static_cast<std::ptrdiff_t>(max_entries));
}

bool is_dangerous_command(const std::string& command) {
    static const char* const kPatterns[] = {
        "rm -rf /",
        "sudo rm",
    };
    for (const char* pattern : kPatterns) {
        if (command.find(pattern) != std::string::npos) return true;
    }
    return false;
}

std::optional<std::string> check_timeout(int64_t timeout_ms) {
    if (timeout_ms > kMaxTimeoutMs) {
        return "Timeout cannot exceed " + std::to_string(kMaxTimeoutMs) + "ms (10 minutes)";
    }
    if (timeout_ms <= 0) {
        return "Timeout must be a positive number of milliseconds";
    }
    return std::nullopt;
}

} // namespace toolhost
