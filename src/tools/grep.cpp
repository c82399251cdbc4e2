#include "grep.hpp"
#include "tool_util.hpp"
#include "../limits.hpp"
#include "../util.hpp"

namespace toolhost {

namespace {

constexpr const char* kNoMatches = "No matches found";

// rg searches can be slow on big trees but must not hang a call forever
constexpr int64_t kGrepTimeoutMs = kDefaultTimeoutMs;

} // namespace

std::optional<ToolResult> parse_grep_options(const nlohmann::json& options, GrepOptions& out) {
    if (options.is_null()) return std::nullopt;
    if (!options.is_object()) {
        return invalid_argument("Parameter must be an object: options");
    }
    if (auto err = optional_string(options, "glob", out.glob)) return err;
    if (auto err = optional_string(options, "type", out.type)) return err;
    if (auto err = optional_bool(options, "-i", out.ignore_case)) return err;
    if (auto err = optional_bool(options, "-n", out.line_number)) return err;
    if (auto err = optional_bool(options, "multiline", out.multiline)) return err;
    if (auto err = optional_int(options, "-B", out.before)) return err;
    if (auto err = optional_int(options, "-A", out.after)) return err;
    if (auto err = optional_int(options, "-C", out.context)) return err;
    if (auto err = optional_string(options, "output_mode", out.output_mode)) return err;
    if (auto err = optional_int(options, "head_limit", out.head_limit)) return err;

    if (out.output_mode != "files_with_matches" && out.output_mode != "count") {
        return invalid_argument("Unsupported output_mode: " + out.output_mode +
                                " (expected files_with_matches or count)");
    }
    if (out.before < 0 || out.after < 0 || out.context < 0 || out.head_limit < 0) {
        return invalid_argument("Context and head_limit values must not be negative");
    }
    return std::nullopt;
}

std::vector<std::string> build_rg_args(const std::string& pattern,
                                       const std::string& search_path,
                                       const GrepOptions& opts) {
    std::vector<std::string> args;

    if (!opts.glob.empty()) {
        args.push_back("--glob");
        args.push_back(opts.glob);
    }
    if (!opts.type.empty()) {
        args.push_back("--type");
        args.push_back(opts.type);
    }
    if (opts.ignore_case) args.push_back("--ignore-case");
    if (opts.line_number) args.push_back("--line-number");
    if (opts.multiline) args.push_back("--multiline");
    if (opts.before > 0) {
        args.push_back("--before-context");
        args.push_back(std::to_string(opts.before));
    }
    if (opts.after > 0) {
        args.push_back("--after-context");
        args.push_back(std::to_string(opts.after));
    }
    if (opts.context > 0) {
        args.push_back("--context");
        args.push_back(std::to_string(opts.context));
    }

    if (opts.output_mode == "files_with_matches") {
        args.push_back("--files-with-matches");
    } else if (opts.output_mode == "count") {
        args.push_back("--count");
    }

    // "--" keeps a pattern such as "-foo" from being read as a flag
    args.push_back("--");
    args.push_back(pattern);
    args.push_back(search_path);
    return args;
}

ToolResult grep_result(const ProcessOutput& proc, const GrepOptions& opts,
                       const std::string& rg_path) {
    if (proc.status == ProcessStatus::SpawnFailed) {
        return ToolResult{false, "Failed to start " + rg_path + ": " + proc.error,
                          ToolError::ProcessSpawnFailure};
    }
    if (proc.status == ProcessStatus::TimedOut) {
        return ToolResult{false, "Grep search timed out after " +
                                 std::to_string(kGrepTimeoutMs) + "ms",
                          ToolError::TimeoutExceeded};
    }

    // rg exits 1 for "no matches"; only a nonzero exit that explains
    // itself on stderr is an execution error.
    if (proc.exit_code != 0 && !proc.stderr_data.empty() &&
        proc.stderr_data.find(kNoMatches) == std::string::npos) {
        return ToolResult{false, truncate_output("Grep search error: " + proc.stderr_data),
                          ToolError::NonZeroExit};
    }

    std::string result = trim(proc.stdout_data);
    if (opts.head_limit > 0) {
        auto lines = split(result, '\n');
        if (lines.size() > static_cast<size_t>(opts.head_limit)) {
            lines.resize(static_cast<size_t>(opts.head_limit));
        }
        result = join(lines, "\n");
    }
    result = truncate_output(result);

    if (result.empty()) return ToolResult{true, kNoMatches};
    return ToolResult{true, result};
}

ToolResult GrepTool::execute(const nlohmann::json& args, const ToolContext& ctx) {
    if (auto err = require_object(args)) return *err;
    if (auto err = require_string(args, "pattern")) return *err;

    // A null or non-string path falls back to the working directory
    std::string path_arg = ".";
    if (args.contains("path") && args["path"].is_string() &&
        !args["path"].get<std::string>().empty()) {
        path_arg = args["path"].get<std::string>();
    }

    GrepOptions opts;
    if (args.contains("options")) {
        if (auto err = parse_grep_options(args["options"], opts)) return *err;
    }

    std::string pattern = args["pattern"].get<std::string>();
    std::string search_path = resolve_path(ctx, path_arg).string();

    ProcessOptions proc;
    proc.argv.push_back(ctx.rg_path);
    for (auto& a : build_rg_args(pattern, search_path, opts)) {
        proc.argv.push_back(std::move(a));
    }
    proc.working_dir = ctx.working_dir;
    proc.timeout_ms = kGrepTimeoutMs;

    return grep_result(run_process(proc), opts, ctx.rg_path);
}

std::string GrepTool::description() const {
    return "Search file contents with a regular expression using ripgrep. Returns matching "
           "file paths by default, or per-file match counts with output_mode \"count\".";
}

std::string GrepTool::parameters_json() const {
    return R"json({"type":"object","properties":{"pattern":{"type":"string","description":"Regular expression to search for"},"path":{"type":"string","description":"File or directory to search (default: working directory)"},"options":{"type":"object","description":"Search options","properties":{"glob":{"type":"string","description":"Only search files matching this glob"},"type":{"type":"string","description":"Only search files of this ripgrep type (js, py, rust, ...)"},"-i":{"type":"boolean","description":"Case insensitive"},"-n":{"type":"boolean","description":"Show line numbers"},"-A":{"type":"number","description":"Lines of context after each match"},"-B":{"type":"number","description":"Lines of context before each match"},"-C":{"type":"number","description":"Lines of context around each match"},"multiline":{"type":"boolean","description":"Allow patterns to span lines"},"output_mode":{"type":"string","enum":["files_with_matches","count"],"description":"files_with_matches (default) or count"},"head_limit":{"type":"number","description":"Keep only the first N lines of output"}}}},"required":["pattern"]})json";
}

} // namespace toolhost
