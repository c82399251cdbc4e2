#pragma once
#include "../tool.hpp"

namespace toolhost {

class FileEditTool : public Tool {
public:
    ToolResult execute(const nlohmann::json& args, const ToolContext& ctx) override;
    ToolId tool_id() const override { return ToolId::Edit; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace toolhost
