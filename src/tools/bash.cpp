#include "bash.hpp"
#include "tool_util.hpp"
#include "../limits.hpp"

namespace toolhost {

ToolResult bash_result(const ProcessOutput& proc, const std::string& description,
                       int64_t timeout_ms) {
    if (proc.status == ProcessStatus::SpawnFailed) {
        return ToolResult{false, "Command execution error: " + proc.error,
                          ToolError::ProcessSpawnFailure};
    }

    std::string output = !proc.stdout_data.empty() ? proc.stdout_data : proc.stderr_data;
    std::string prefix = description.empty() ? "" : "[" + description + "] ";

    if (proc.status == ProcessStatus::TimedOut) {
        std::string text = "Command timed out after " + std::to_string(timeout_ms) + "ms";
        if (!output.empty()) text += "\n" + output;
        return ToolResult{false, truncate_output(prefix + text), ToolError::TimeoutExceeded};
    }

    std::string text = truncate_output(prefix + output);
    if (proc.exit_code == 0) {
        return ToolResult{true, text};
    }
    return ToolResult{false, text, ToolError::NonZeroExit};
}

ToolResult BashTool::execute(const nlohmann::json& args, const ToolContext& ctx) {
    if (auto err = require_object(args)) return *err;
    if (auto err = require_string(args, "command")) return *err;

    std::string description;
    int64_t timeout_ms = kDefaultTimeoutMs;
    if (auto err = optional_string(args, "description", description)) return *err;
    if (auto err = optional_int(args, "timeout", timeout_ms)) return *err;

    std::string command = args["command"].get<std::string>();

    // Both checks run before anything is spawned
    if (auto msg = check_timeout(timeout_ms)) {
        return ToolResult{false, *msg, ToolError::TimeoutExceeded};
    }
    if (is_dangerous_command(command)) {
        return ToolResult{false, "Dangerous command detected", ToolError::Dangerous};
    }

    ProcessOptions opts;
    opts.argv = shell_argv(ctx.shell, command);
    opts.working_dir = ctx.working_dir;
    opts.env = {{"TERM", "xterm-256color"}};
    opts.timeout_ms = timeout_ms;

    return bash_result(run_process(opts), description, timeout_ms);
}

std::string BashTool::description() const {
    return "Execute a shell command in the working directory. Returns stdout, or stderr "
           "when stdout is empty. Default timeout 120000ms, maximum 600000ms.";
}

std::string BashTool::parameters_json() const {
    return R"json({"type":"object","properties":{"command":{"type":"string","description":"The shell command line to execute"},"description":{"type":"string","description":"Short label shown in brackets before the output"},"timeout":{"type":"number","description":"Timeout in milliseconds (default 120000, max 600000)"}},"required":["command"]})json";
}

} // namespace toolhost
