#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace toolhost {

// Hard caps shared by every tool. Character counts are UTF-8 code points.
constexpr size_t kMaxOutputChars = 30000;
constexpr size_t kMaxArrayEntries = 1000;
constexpr size_t kMaxLineChars = 2000;
constexpr size_t kDefaultReadLines = 2000;
constexpr int64_t kDefaultTimeoutMs = 120000;
constexpr int64_t kMaxTimeoutMs = 600000;

// Cap text at kMaxOutputChars (silent truncation).
std::string truncate_output(const std::string& text, size_t max_chars = kMaxOutputChars);

// Cap text and append a marker when anything was cut. The result,
// marker included, never exceeds max_chars.
std::string truncate_with_marker(const std::string& text, const std::string& marker,
                                 size_t max_chars = kMaxOutputChars);

// Keep the first kMaxArrayEntries items
std::vector<std::string> cap_entries(const std::vector<std::string>& items,
                                     size_t max_entries = kMaxArrayEntries);

// Literal substring screen for a few catastrophic commands.
// Best-effort only: trivially bypassed, not a sandbox.
bool is_dangerous_command(const std::string& command);

// Error message when timeout_ms is outside (0, kMaxTimeoutMs]
std::optional<std::string> check_timeout(int64_t timeout_ms);

} // namespace toolhost
