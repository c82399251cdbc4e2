#pragma once
#include "../tool.hpp"

namespace toolhost {

class TodoWriteTool : public Tool {
public:
    ToolResult execute(const nlohmann::json& args, const ToolContext& ctx) override;
    ToolId tool_id() const override { return ToolId::TodoWrite; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace toolhost
