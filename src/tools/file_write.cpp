#include "file_write.hpp"
#include "tool_util.hpp"
#include <filesystem>

namespace toolhost {

ToolResult FileWriteTool::execute(const nlohmann::json& args, const ToolContext& ctx) {
    if (auto err = require_object(args)) return *err;
    if (auto err = require_string(args, "file_path")) return *err;
    if (auto err = require_string(args, "content")) return *err;

    auto path = resolve_path(ctx, args["file_path"].get<std::string>());
    std::string content = args["content"].get<std::string>();

    std::error_code ec;
    bool existed = std::filesystem::exists(path, ec);
    if (existed) {
        if (std::filesystem::is_directory(path, ec)) {
            return ToolResult{false, "Path is a directory, not a file: " + path.string(),
                              ToolError::InvalidArguments};
        }
        std::string current;
        if (read_whole_file(path, current) && current == content) {
            return ToolResult{true, "File unchanged: " + path.string() + " (content is identical)"};
        }
    }

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return ToolResult{false, "Failed to create directories: " + ec.message(),
                              ToolError::IoError};
        }
    }

    if (!write_whole_file(path, content)) {
        return ToolResult{false, "Failed to write to file: " + path.string(), ToolError::IoError};
    }

    std::string action = existed ? "overwrote" : "created";
    return ToolResult{true, "Successfully " + action + " file: " + path.string()};
}

std::string FileWriteTool::description() const {
    return "Write content to a file, creating it and any missing parent directories. "
           "Overwrites existing files; identical content leaves the file untouched.";
}

std::string FileWriteTool::parameters_json() const {
    return R"json({"type":"object","properties":{"file_path":{"type":"string","description":"Path of the file to write"},"content":{"type":"string","description":"The full content to write to the file"}},"required":["file_path","content"]})json";
}

} // namespace toolhost
