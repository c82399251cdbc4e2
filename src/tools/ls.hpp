#pragma once
#include "../tool.hpp"

namespace toolhost {

class LsTool : public Tool {
public:
    ToolResult execute(const nlohmann::json& args, const ToolContext& ctx) override;
    ToolId tool_id() const override { return ToolId::LS; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace toolhost
