#include "file_edit.hpp"
#include "tool_util.hpp"
#include "../util.hpp"

namespace toolhost {

ToolResult FileEditTool::execute(const nlohmann::json& args, const ToolContext& ctx) {
    if (auto err = require_object(args)) return *err;
    if (auto err = require_string(args, "file_path")) return *err;
    if (auto err = require_string(args, "old_string")) return *err;
    if (auto err = require_string(args, "new_string")) return *err;

    bool replace_all_occurrences = false;
    if (auto err = optional_bool(args, "replace_all", replace_all_occurrences)) return *err;

    auto path = resolve_path(ctx, args["file_path"].get<std::string>());
    std::string old_string = args["old_string"].get<std::string>();
    std::string new_string = args["new_string"].get<std::string>();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ToolResult{false, "File not found: " + path.string(), ToolError::NotFound};
    }

    if (old_string == new_string) {
        return ToolResult{true, "No changes made: old_string and new_string are identical"};
    }
    if (old_string.empty()) {
        return invalid_argument("old_string must not be empty");
    }

    std::string contents;
    if (!read_whole_file(path, contents)) {
        return ToolResult{false, "Failed to open file: " + path.string(), ToolError::IoError};
    }

    // Literal match, never a regex
    size_t first_pos = contents.find(old_string);
    if (first_pos == std::string::npos) {
        return ToolResult{false, "String not found in file: " + old_string,
                          ToolError::PatternNotFound};
    }

    std::string updated;
    if (replace_all_occurrences) {
        updated = replace_all(contents, old_string, new_string);
    } else {
        updated = contents;
        updated.replace(first_pos, old_string.size(), new_string);
    }

    if (updated != contents && !write_whole_file(path, updated)) {
        return ToolResult{false, "Failed to write to file: " + path.string(), ToolError::IoError};
    }

    std::string action = replace_all_occurrences ? "replaced all occurrences" : "replaced";
    return ToolResult{true, "Successfully " + action + " in file: " + path.string()};
}

std::string FileEditTool::description() const {
    return "Edit a file by replacing an exact string. Only the first occurrence is "
           "replaced unless replace_all is true. old_string is matched literally.";
}

std::string FileEditTool::parameters_json() const {
    return R"json({"type":"object","properties":{"file_path":{"type":"string","description":"Path of the file to edit"},"old_string":{"type":"string","description":"The exact text to find"},"new_string":{"type":"string","description":"The replacement text"},"replace_all":{"type":"boolean","description":"Replace every occurrence instead of only the first (default false)"}},"required":["file_path","old_string","new_string"]})json";
}

} // namespace toolhost
