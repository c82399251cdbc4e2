#include "file_read.hpp"
#include "tool_util.hpp"
#include "../limits.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cstdio>

namespace toolhost {

std::string format_numbered_lines(const std::vector<std::string>& lines, size_t first_line) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        char num[32];
        std::snprintf(num, sizeof(num), "%5zu", first_line + i);
        out += num;
        out += "→";
        out += utf8_truncate(lines[i], kMaxLineChars);
    }
    return out;
}

ToolResult FileReadTool::execute(const nlohmann::json& args, const ToolContext& ctx) {
    if (auto err = require_object(args)) return *err;
    if (auto err = require_string(args, "file_path")) return *err;

    int64_t offset = 0;
    int64_t limit = 0;
    bool has_limit = has_value(args, "limit");
    if (auto err = optional_int(args, "offset", offset)) return *err;
    if (auto err = optional_int(args, "limit", limit)) return *err;
    if (offset < 0) return invalid_argument("offset must not be negative");
    if (has_limit && limit < 0) return invalid_argument("limit must not be negative");

    auto path = resolve_path(ctx, args["file_path"].get<std::string>());

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ToolResult{false, "File not found: " + path.string(), ToolError::NotFound};
    }
    if (std::filesystem::is_directory(path, ec)) {
        return ToolResult{false, "Path is a directory, not a file: " + path.string(),
                          ToolError::InvalidArguments};
    }

    std::string contents;
    if (!read_whole_file(path, contents)) {
        return ToolResult{false, "Failed to open file: " + path.string(), ToolError::IoError};
    }

    if (contents.empty()) {
        return ToolResult{true, "<system-reminder>File exists but has empty contents: " +
                                path.string() + "</system-reminder>"};
    }

    auto lines = split(contents, '\n');
    size_t start = std::min(static_cast<size_t>(offset), lines.size());
    size_t end = has_limit
        ? start + static_cast<size_t>(limit)
        : start + kDefaultReadLines;
    end = std::min(end, lines.size());

    std::vector<std::string> window(lines.begin() + static_cast<std::ptrdiff_t>(start),
                                    lines.begin() + static_cast<std::ptrdiff_t>(end));

    return ToolResult{true, truncate_output(format_numbered_lines(window, start + 1))};
}

std::string FileReadTool::description() const {
    return "Read a file from the working directory. Lines are returned numbered "
           "(cat -n style). Reads up to 2000 lines from offset by default; lines "
           "longer than 2000 characters are truncated.";
}

std::string FileReadTool::parameters_json() const {
    return R"json({"type":"object","properties":{"file_path":{"type":"string","description":"Path of the file to read, absolute or relative to the working directory"},"offset":{"type":"number","description":"Zero-based line to start reading from"},"limit":{"type":"number","description":"Number of lines to read"}},"required":["file_path"]})json";
}

} // namespace toolhost
