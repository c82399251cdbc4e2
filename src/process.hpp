#pragma once
#include "limits.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace toolhost {

struct ProcessOptions {
    std::vector<std::string> argv;      // argv[0] is looked up in PATH
    std::filesystem::path working_dir;  // empty = inherit
    std::vector<std::pair<std::string, std::string>> env; // added to / replacing the inherited environment
    int64_t timeout_ms = kDefaultTimeoutMs;
};

enum class ProcessStatus {
    Exited,      // ran to completion (any exit code)
    TimedOut,    // killed after timeout_ms
    SpawnFailed, // never started
};

struct ProcessOutput {
    ProcessStatus status = ProcessStatus::Exited;
    int exit_code = -1;      // 128 + signal number when killed by a signal
    std::string stdout_data;
    std::string stderr_data;
    std::string error;       // reason for SpawnFailed
};

// Run a child to completion, racing it against the timeout. On expiry the
// whole process group is killed. Both pipes are drained before returning.
ProcessOutput run_process(const ProcessOptions& opts);

// {shell, "-c", command}
std::vector<std::string> shell_argv(const std::string& shell, const std::string& command);

} // namespace toolhost
