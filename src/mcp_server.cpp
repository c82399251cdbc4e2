#include "mcp_server.hpp"
#include "util.hpp"
#include "version.hpp"
#include <iostream>
#include <stdexcept>

namespace toolhost {

namespace {

// Thrown inside a request handler to produce a JSON-RPC error reply.
struct RpcError : std::runtime_error {
    int code;
    RpcError(int c, const std::string& message) : std::runtime_error(message), code(c) {}
};

} // namespace

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id},
            {"error", {{"code", code}, {"message", message}}}};
}

std::string encode_frame(const nlohmann::json& frame) {
    return frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

McpServer::McpServer(const ToolRegistry& registry, ToolContext ctx, bool log_calls)
    : registry_(registry), ctx_(std::move(ctx)), log_calls_(log_calls) {}

nlohmann::json McpServer::handle_initialize(const nlohmann::json& params) const {
    std::string version = kDefaultProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }
    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", "toolhost"}, {"version", TOOLHOST_VERSION}}}
    };
}

nlohmann::json McpServer::handle_tools_list() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& spec : registry_.specs()) {
        tools.push_back({
            {"name", spec.name},
            {"description", spec.description},
            {"inputSchema", nlohmann::json::parse(spec.parameters_json)}
        });
    }
    return {{"tools", tools}};
}

nlohmann::json McpServer::handle_tools_call(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw RpcError(kInvalidParams, "Invalid params: missing tool name");
    }

    ToolCall call;
    call.name = params["name"].get<std::string>();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        call.arguments = params["arguments"];
    }

    ToolResponse response = dispatch_tool(call, registry_, ctx_, log_calls_);
    nlohmann::json result = {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", response.text}}})}
    };
    if (response.is_error) result["isError"] = true;
    return result;
}

std::optional<nlohmann::json> McpServer::handle_message(const nlohmann::json& msg) {
    if (!msg.is_object()) {
        return make_error(nullptr, kInvalidRequest, "Invalid Request");
    }

    bool has_id = msg.contains("id");
    nlohmann::json id = has_id ? msg["id"] : nlohmann::json(nullptr);

    if (!msg.contains("method") || !msg["method"].is_string()) {
        // A response from the client needs no reply
        if (msg.contains("result") || msg.contains("error")) return std::nullopt;
        return make_error(id, kInvalidRequest, "Invalid Request");
    }

    std::string method = msg["method"].get<std::string>();
    nlohmann::json params = msg.contains("params") ? msg["params"] : nlohmann::json::object();

    // Notifications never get a reply
    if (!has_id) {
        if (log_calls_ && method.rfind("notifications/", 0) != 0) {
            std::cerr << "[mcp] Ignoring notification: " << method << "\n";
        }
        return std::nullopt;
    }

    try {
        if (method == "initialize") return make_result(id, handle_initialize(params));
        if (method == "ping") return make_result(id, nlohmann::json::object());
        if (method == "tools/list") return make_result(id, handle_tools_list());
        if (method == "tools/call") return make_result(id, handle_tools_call(params));
    } catch (const RpcError& e) {
        return make_error(id, e.code, e.what());
    }
    return make_error(id, kMethodNotFound, "Method not found: " + method);
}

std::optional<nlohmann::json> McpServer::handle_line(const std::string& line) {
    if (trim(line).empty()) return std::nullopt;

    nlohmann::json msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded()) {
        std::cerr << "[mcp] Parse error on input line\n";
        return make_error(nullptr, kParseError, "Parse error");
    }
    return handle_message(msg);
}

void McpServer::run(std::istream& in, std::ostream& out, const std::atomic<bool>* stop) {
    std::string line;
    while (!(stop && stop->load()) && std::getline(in, line)) {
        auto reply = handle_line(line);
        if (reply) {
            out << encode_frame(*reply) << "\n" << std::flush;
        }
    }
}

} // namespace toolhost
