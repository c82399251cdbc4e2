#pragma once
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>

namespace toolhost {

struct ToolCall {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

// Uniform reply for every call; text is capped and never null.
struct ToolResponse {
    std::string text;
    bool is_error = false;
};

// Owns one handler per ToolId. Descriptors are checked once at
// construction; a bad descriptor throws std::invalid_argument.
class ToolRegistry {
public:
    explicit ToolRegistry(std::vector<std::unique_ptr<Tool>> tools);

    Tool* find(ToolId id) const;
    Tool* find(const std::string& name) const;

    // Descriptors in catalogue order
    std::vector<ToolSpec> specs() const;

    size_t size() const { return tools_.size(); }

private:
    std::vector<std::unique_ptr<Tool>> tools_;
};

// Merge a handler result into the envelope: failures become "Error: <message>".
ToolResponse to_response(const ToolResult& result);

// Execute a single tool call, finding the tool by name. Exceptions that
// escape a handler are reported as errors, never rethrown.
ToolResponse dispatch_tool(const ToolCall& call, const ToolRegistry& registry,
                           const ToolContext& ctx, bool log_calls = false);

} // namespace toolhost
