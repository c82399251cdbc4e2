#include "dispatcher.hpp"
#include "limits.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace toolhost {

namespace {

size_t catalogue_index(ToolId id) {
    auto it = std::find(kAllToolIds.begin(), kAllToolIds.end(), id);
    return static_cast<size_t>(it - kAllToolIds.begin());
}

void validate_descriptor(const Tool& tool) {
    auto spec = tool.spec();
    auto id = tool_id_from_name(spec.name);
    if (!id || *id != tool.tool_id()) {
        throw std::invalid_argument("Tool name does not match its id: " + spec.name);
    }
    if (spec.description.empty()) {
        throw std::invalid_argument("Tool has no description: " + spec.name);
    }
    nlohmann::json schema = nlohmann::json::parse(spec.parameters_json, nullptr, false);
    if (schema.is_discarded() || !schema.is_object() || !schema.contains("type") ||
        schema["type"] != "object") {
        throw std::invalid_argument("Tool schema is not an object schema: " + spec.name);
    }
}

} // namespace

ToolRegistry::ToolRegistry(std::vector<std::unique_ptr<Tool>> tools)
    : tools_(std::move(tools)) {
    for (size_t i = 0; i < tools_.size(); ++i) {
        if (!tools_[i]) throw std::invalid_argument("Null tool in registry");
        validate_descriptor(*tools_[i]);
        for (size_t j = 0; j < i; ++j) {
            if (tools_[j]->tool_id() == tools_[i]->tool_id()) {
                throw std::invalid_argument("Duplicate tool: " + tools_[i]->tool_name());
            }
        }
    }
    std::sort(tools_.begin(), tools_.end(), [](const auto& a, const auto& b) {
        return catalogue_index(a->tool_id()) < catalogue_index(b->tool_id());
    });
}

Tool* ToolRegistry::find(ToolId id) const {
    for (const auto& tool : tools_) {
        if (tool->tool_id() == id) return tool.get();
    }
    return nullptr;
}

Tool* ToolRegistry::find(const std::string& name) const {
    auto id = tool_id_from_name(name);
    return id ? find(*id) : nullptr;
}

std::vector<ToolSpec> ToolRegistry::specs() const {
    std::vector<ToolSpec> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) out.push_back(tool->spec());
    return out;
}

ToolResponse to_response(const ToolResult& result) {
    if (result.success) {
        return ToolResponse{truncate_output(result.output), false};
    }
    return ToolResponse{truncate_output("Error: " + result.output), true};
}

ToolResponse dispatch_tool(const ToolCall& call, const ToolRegistry& registry,
                           const ToolContext& ctx, bool log_calls) {
    Tool* tool = registry.find(call.name);
    if (!tool) {
        if (log_calls) std::cerr << "[tool] Unknown tool: " << call.name << "\n";
        return to_response(ToolResult{false, "Unknown tool: " + call.name,
                                      ToolError::UnknownTool});
    }

    if (log_calls) std::cerr << "[tool] " << call.name << "\n";

    ToolResult result{false, "", ToolError::None};
    try {
        result = tool->execute(call.arguments, ctx);
    } catch (const std::exception& e) {
        result = ToolResult{false, "Tool " + call.name + " failed: " + e.what(),
                            ToolError::IoError};
    }

    if (log_calls && !result.success) {
        std::cerr << "[tool] " << call.name << " failed ("
                  << tool_error_name(result.error) << ")\n";
    }
    return to_response(result);
}

} // namespace toolhost
