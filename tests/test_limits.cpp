#include <catch2/catch_test_macros.hpp>
#include "limits.hpp"
#include "util.hpp"

using namespace toolhost;

// ── Output caps ──────────────────────────────────────────────────

TEST_CASE("truncate_output: short text unchanged", "[limits]") {
    REQUIRE(truncate_output("hello") == "hello");
}

TEST_CASE("truncate_output: caps at 30000 characters", "[limits]") {
    std::string big(40000, 'x');
    auto out = truncate_output(big);
    REQUIRE(out.size() == kMaxOutputChars);
}

TEST_CASE("truncate_output: counts characters, not bytes", "[limits]") {
    std::string arrows;
    for (int i = 0; i < 30000; ++i) arrows += "\xe2\x86\x92";
    // Exactly at the cap: nothing removed even though bytes exceed it
    REQUIRE(truncate_output(arrows) == arrows);
    REQUIRE(utf8_length(truncate_output(arrows + "x")) == kMaxOutputChars);
}

TEST_CASE("truncate_with_marker: total stays within the cap", "[limits]") {
    std::string marker = "\n\n[cut]";
    std::string big(100, 'a');
    auto out = truncate_with_marker(big, marker, 50);
    REQUIRE(out.size() == 50);
    REQUIRE(out.substr(out.size() - marker.size()) == marker);
}

TEST_CASE("truncate_with_marker: no marker when under the cap", "[limits]") {
    REQUIRE(truncate_with_marker("short", "[cut]", 50) == "short");
}

TEST_CASE("cap_entries: keeps the first 1000", "[limits]") {
    std::vector<std::string> items;
    for (int i = 0; i < 1500; ++i) items.push_back(std::to_string(i));
    auto capped = cap_entries(items);
    REQUIRE(capped.size() == kMaxArrayEntries);
    REQUIRE(capped.front() == "0");
    REQUIRE(capped.back() == "999");
}

// ── Dangerous commands ───────────────────────────────────────────

TEST_CASE("is_dangerous_command: denylisted substrings", "[limits]") {
    REQUIRE(is_dangerous_command("rm -rf /"));
    REQUIRE(is_dangerous_command("cd /tmp && rm -rf /var"));
    REQUIRE(is_dangerous_command("sudo rm file"));
}

TEST_CASE("is_dangerous_command: ordinary commands pass", "[limits]") {
    REQUIRE_FALSE(is_dangerous_command("ls -la"));
    REQUIRE_FALSE(is_dangerous_command("rm -rf build"));
    REQUIRE_FALSE(is_dangerous_command("sudo ls"));
}

// ── Timeouts ─────────────────────────────────────────────────────

TEST_CASE("check_timeout: ceiling is 600000ms inclusive", "[limits]") {
    REQUIRE_FALSE(check_timeout(600000).has_value());
    REQUIRE_FALSE(check_timeout(1).has_value());
    auto msg = check_timeout(600001);
    REQUIRE(msg.has_value());
    REQUIRE(*msg == "Timeout cannot exceed 600000ms (10 minutes)");
}

TEST_CASE("check_timeout: non-positive rejected", "[limits]") {
    REQUIRE(check_timeout(0).has_value());
    REQUIRE(check_timeout(-5).has_value());
}
