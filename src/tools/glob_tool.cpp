#include "glob_tool.hpp"
#include "tool_util.hpp"
#include "../glob.hpp"
#include "../limits.hpp"
#include "../util.hpp"

namespace toolhost {

ToolResult GlobTool::execute(const nlohmann::json& args, const ToolContext& ctx) {
    if (auto err = require_object(args)) return *err;
    if (auto err = require_string(args, "pattern")) return *err;

    std::string path_arg;
    bool as_array = false;
    if (auto err = optional_string(args, "path", path_arg)) return *err;
    if (auto err = optional_bool(args, "as_array", as_array)) return *err;

    std::string pattern = args["pattern"].get<std::string>();
    if (pattern.empty()) return invalid_argument("pattern must not be empty");

    auto base = path_arg.empty() ? ctx.working_dir : resolve_path(ctx, path_arg);

    std::vector<std::string> paths;
    for (auto& m : glob_files(base, pattern)) {
        paths.push_back(std::move(m.path));
    }

    if (as_array) {
        nlohmann::json arr = cap_entries(paths);
        return ToolResult{true, arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
    }

    if (paths.empty()) return ToolResult{true, "No files matched"};
    return ToolResult{true, truncate_output(join(paths, "\n"))};
}

std::string GlobTool::description() const {
    return "Find files by glob pattern (supports **, *, ?, [..] and {a,b}). Dotfiles are "
           "included. Results are sorted by modification time, most recent first.";
}

std::string GlobTool::parameters_json() const {
    return R"json({"type":"object","properties":{"pattern":{"type":"string","description":"Glob pattern, e.g. \"**/*.cpp\""},"path":{"type":"string","description":"Directory to search from (default: working directory)"},"as_array":{"type":"boolean","description":"Return a JSON array of at most 1000 paths"}},"required":["pattern"]})json";
}

} // namespace toolhost
