#pragma once
#include "../tool.hpp"
#include "../process.hpp"
#include <string>

namespace toolhost {

class BashTool : public Tool {
public:
    ToolResult execute(const nlohmann::json& args, const ToolContext& ctx) override;
    ToolId tool_id() const override { return ToolId::Bash; }
    std::string description() const override;
    std::string parameters_json() const override;
};

// Map a finished process to the Bash result: stdout if non-empty, else
// stderr, capped, with an optional "[description] " prefix.
ToolResult bash_result(const ProcessOutput& proc, const std::string& description,
                       int64_t timeout_ms);

} // namespace toolhost
