#include <catch2/catch_test_macros.hpp>
#include "process.hpp"
#include "test_helpers.hpp"
#include <chrono>

using namespace toolhost;

static ProcessOutput sh(const std::string& command, int64_t timeout_ms = 10000,
                        const std::filesystem::path& cwd = {}) {
    ProcessOptions opts;
    opts.argv = shell_argv("/bin/sh", command);
    opts.working_dir = cwd;
    opts.timeout_ms = timeout_ms;
    return run_process(opts);
}

TEST_CASE("run_process: captures stdout and exit code", "[process]") {
    auto out = sh("echo hello");
    REQUIRE(out.status == ProcessStatus::Exited);
    REQUIRE(out.exit_code == 0);
    REQUIRE(out.stdout_data == "hello\n");
    REQUIRE(out.stderr_data.empty());
}

TEST_CASE("run_process: stderr captured separately", "[process]") {
    auto out = sh("echo out; echo err >&2; exit 3");
    REQUIRE(out.status == ProcessStatus::Exited);
    REQUIRE(out.exit_code == 3);
    REQUIRE(out.stdout_data == "out\n");
    REQUIRE(out.stderr_data == "err\n");
}

TEST_CASE("run_process: runs in the working directory", "[process]") {
    TempDir dir;
    REQUIRE(dir.ok());
    auto out = sh("pwd -P", 10000, dir.path());
    auto expected = std::filesystem::canonical(dir.path()).string() + "\n";
    REQUIRE(out.stdout_data == expected);
}

TEST_CASE("run_process: environment overrides", "[process]") {
    ProcessOptions opts;
    opts.argv = shell_argv("/bin/sh", "printf %s \"$TOOLHOST_TEST_VAR\"");
    opts.env = {{"TOOLHOST_TEST_VAR", "set"}};
    auto out = run_process(opts);
    REQUIRE(out.stdout_data == "set");
}

TEST_CASE("run_process: stdin is closed", "[process]") {
    auto out = sh("cat; echo done");
    REQUIRE(out.status == ProcessStatus::Exited);
    REQUIRE(out.stdout_data == "done\n");
}

TEST_CASE("run_process: timeout kills the process group", "[process]") {
    auto start = std::chrono::steady_clock::now();
    auto out = sh("echo partial; sleep 30", 300);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(out.status == ProcessStatus::TimedOut);
    REQUIRE(out.stdout_data == "partial\n");
    REQUIRE(elapsed < std::chrono::seconds(5));
}

TEST_CASE("run_process: deadline applies after streams close", "[process]") {
    auto start = std::chrono::steady_clock::now();
    auto out = sh("exec >/dev/null 2>&1; sleep 30", 300);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(out.status == ProcessStatus::TimedOut);
    REQUIRE(elapsed < std::chrono::seconds(5));
}

TEST_CASE("run_process: missing binary is a spawn failure", "[process]") {
    ProcessOptions opts;
    opts.argv = {"toolhost-no-such-binary-xyz"};
    auto out = run_process(opts);
    REQUIRE(out.status == ProcessStatus::SpawnFailed);
    REQUIRE_FALSE(out.error.empty());
}

TEST_CASE("run_process: missing working directory is a spawn failure", "[process]") {
    auto out = sh("true", 10000, "/nonexistent/toolhost/dir");
    REQUIRE(out.status == ProcessStatus::SpawnFailed);
}

TEST_CASE("run_process: empty argv", "[process]") {
    ProcessOptions opts;
    auto out = run_process(opts);
    REQUIRE(out.status == ProcessStatus::SpawnFailed);
}
