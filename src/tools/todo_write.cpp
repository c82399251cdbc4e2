#include "todo_write.hpp"
#include "tool_util.hpp"
#include "../limits.hpp"

namespace toolhost {

namespace {

bool valid_status(const std::string& status) {
    return status == "pending" || status == "in_progress" || status == "completed";
}

} // namespace

ToolResult TodoWriteTool::execute(const nlohmann::json& args, const ToolContext& /*ctx*/) {
    if (auto err = require_object(args)) return *err;
    if (!args.is_object() || !args.contains("todos") || !args["todos"].is_array()) {
        return invalid_argument("Missing required parameter: todos");
    }

    const auto& todos = args["todos"];
    for (size_t i = 0; i < todos.size(); ++i) {
        const auto& item = todos[i];
        std::string where = "todos[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            return invalid_argument(where + " must be an object");
        }
        for (const char* field : {"content", "status", "activeForm"}) {
            if (!item.contains(field) || !item[field].is_string()) {
                return invalid_argument(where + " is missing string field: " + field);
            }
        }
        auto status = item["status"].get<std::string>();
        if (!valid_status(status)) {
            return invalid_argument(where + " has invalid status: " + status +
                                    " (expected pending, in_progress or completed)");
        }
    }

    return ToolResult{true, truncate_output("TodoWrite: " + todos.dump(2, ' ', false, nlohmann::json::error_handler_t::replace))};
}

std::string TodoWriteTool::description() const {
    return "Record the caller's task list. Echoes the list back; has no other effect.";
}

std::string TodoWriteTool::parameters_json() const {
    return R"json({"type":"object","properties":{"todos":{"type":"array","description":"The full task list","items":{"type":"object","properties":{"content":{"type":"string"},"status":{"type":"string","enum":["pending","in_progress","completed"]},"activeForm":{"type":"string"}},"required":["content","status","activeForm"]}}},"required":["todos"]})json";
}

} // namespace toolhost
