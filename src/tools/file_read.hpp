#pragma once
#include "../tool.hpp"

namespace toolhost {

class FileReadTool : public Tool {
public:
    ToolResult execute(const nlohmann::json& args, const ToolContext& ctx) override;
    ToolId tool_id() const override { return ToolId::Read; }
    std::string description() const override;
    std::string parameters_json() const override;
};

// Number a window of lines the way Read prints them:
// 1-based line number right-justified to width 5, then "→".
std::string format_numbered_lines(const std::vector<std::string>& lines, size_t first_line);

} // namespace toolhost
