#pragma once
#include "../tool.hpp"
#include "../readability.hpp"
#include <string>

namespace toolhost {

class HttpClient;

class WebFetchTool : public Tool {
public:
    explicit WebFetchTool(HttpClient& http) : http_(http) {}

    ToolResult execute(const nlohmann::json& args, const ToolContext& ctx) override;
    ToolId tool_id() const override { return ToolId::WebFetch; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    HttpClient& http_;
};

// Render an extracted article. Text past the output cap is cut and marked.
std::string format_web_fetch(const std::string& url, const Article& article);

} // namespace toolhost
