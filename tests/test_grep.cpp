#include <catch2/catch_test_macros.hpp>
#include "tools/grep.hpp"
#include "process.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>

using namespace toolhost;
using nlohmann::json;

static bool rg_available() {
    ProcessOptions opts;
    opts.argv = {"rg", "--version"};
    opts.timeout_ms = 10000;
    auto out = run_process(opts);
    return out.status == ProcessStatus::Exited && out.exit_code == 0;
}

// ── Argument building ────────────────────────────────────────────

TEST_CASE("build_rg_args: default mode lists matching files", "[grep]") {
    GrepOptions opts;
    auto args = build_rg_args("foo", "/work", opts);
    REQUIRE(args == std::vector<std::string>{"--files-with-matches", "--", "foo", "/work"});
}

TEST_CASE("build_rg_args: all options map to rg flags", "[grep]") {
    GrepOptions opts;
    opts.glob = "*.cpp";
    opts.type = "cpp";
    opts.ignore_case = true;
    opts.line_number = true;
    opts.multiline = true;
    opts.before = 2;
    opts.after = 3;
    opts.context = 1;
    opts.output_mode = "count";
    auto args = build_rg_args("-pat", "/p", opts);
    REQUIRE(args == std::vector<std::string>{
        "--glob", "*.cpp", "--type", "cpp", "--ignore-case", "--line-number",
        "--multiline", "--before-context", "2", "--after-context", "3",
        "--context", "1", "--count", "--", "-pat", "/p"});
}

TEST_CASE("parse_grep_options: reads flag-style keys", "[grep]") {
    GrepOptions opts;
    auto err = parse_grep_options(json{{"-i", true}, {"-n", true}, {"-C", 2},
                                       {"head_limit", 5}}, opts);
    REQUIRE_FALSE(err.has_value());
    REQUIRE(opts.ignore_case);
    REQUIRE(opts.line_number);
    REQUIRE(opts.context == 2);
    REQUIRE(opts.head_limit == 5);
}

TEST_CASE("parse_grep_options: rejects unknown output_mode", "[grep]") {
    GrepOptions opts;
    auto err = parse_grep_options(json{{"output_mode", "content"}}, opts);
    REQUIRE(err.has_value());
    REQUIRE(err->error == ToolError::InvalidArguments);
}

// ── Result interpretation ────────────────────────────────────────

TEST_CASE("grep_result: exit 1 without stderr is no matches", "[grep]") {
    ProcessOutput proc;
    proc.exit_code = 1;
    auto result = grep_result(proc, GrepOptions{}, "rg");
    REQUIRE(result.success);
    REQUIRE(result.output == "No matches found");
}

TEST_CASE("grep_result: stderr on failure is an error", "[grep]") {
    ProcessOutput proc;
    proc.exit_code = 2;
    proc.stderr_data = "regex parse error";
    auto result = grep_result(proc, GrepOptions{}, "rg");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Grep search error: regex parse error");
}

TEST_CASE("grep_result: head_limit keeps the first lines", "[grep]") {
    ProcessOutput proc;
    proc.exit_code = 0;
    proc.stdout_data = "a\nb\nc\nd\n";
    GrepOptions opts;
    opts.head_limit = 2;
    auto result = grep_result(proc, opts, "rg");
    REQUIRE(result.success);
    REQUIRE(result.output == "a\nb");
}

TEST_CASE("grep_result: missing binary is a spawn failure", "[grep]") {
    ProcessOutput proc;
    proc.status = ProcessStatus::SpawnFailed;
    proc.error = "No such file or directory";
    auto result = grep_result(proc, GrepOptions{}, "rg");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ToolError::ProcessSpawnFailure);
}

// ── End to end (requires rg) ─────────────────────────────────────

TEST_CASE("GrepTool: finds files containing the pattern", "[grep]") {
    if (!rg_available()) {
        WARN("rg not installed; skipping");
        return;
    }
    TempDir dir;
    REQUIRE(dir.ok());
    write_file(dir.path() / "hit.txt", "needle here\n");
    write_file(dir.path() / "miss.txt", "nothing\n");

    GrepTool tool;
    auto result = tool.execute(json{{"pattern", "needle"}}, dir.context());
    REQUIRE(result.success);
    REQUIRE(result.output.find("hit.txt") != std::string::npos);
    REQUIRE(result.output.find("miss.txt") == std::string::npos);
}

TEST_CASE("GrepTool: count mode", "[grep]") {
    if (!rg_available()) {
        WARN("rg not installed; skipping");
        return;
    }
    TempDir dir;
    REQUIRE(dir.ok());
    write_file(dir.path() / "a.txt", "x\nx\ny\n");

    GrepTool tool;
    auto result = tool.execute(json{{"pattern", "x"}, {"path", "a.txt"},
                                    {"options", {{"output_mode", "count"}}}},
                               dir.context());
    REQUIRE(result.success);
    REQUIRE(result.output == "2");
}

TEST_CASE("GrepTool: no match is not an error", "[grep]") {
    if (!rg_available()) {
        WARN("rg not installed; skipping");
        return;
    }
    TempDir dir;
    REQUIRE(dir.ok());
    write_file(dir.path() / "a.txt", "abc\n");

    GrepTool tool;
    auto result = tool.execute(json{{"pattern", "zzz"}, {"path", nullptr}}, dir.context());
    REQUIRE(result.success);
    REQUIRE(result.output == "No matches found");
}
