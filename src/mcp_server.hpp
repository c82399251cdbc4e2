#pragma once
#include "dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <iosfwd>
#include <optional>
#include <string>

namespace toolhost {

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

constexpr const char* kDefaultProtocolVersion = "2024-11-05";

// MCP server over newline-delimited JSON-RPC. One request is handled at
// a time; stdout carries protocol frames only.
class McpServer {
public:
    McpServer(const ToolRegistry& registry, ToolContext ctx, bool log_calls = false);

    // Reply for one decoded message; nullopt for notifications and for
    // responses sent by the client.
    std::optional<nlohmann::json> handle_message(const nlohmann::json& msg);

    // Decode one line and handle it. Blank lines yield nullopt.
    std::optional<nlohmann::json> handle_line(const std::string& line);

    // Serve until EOF or until *stop becomes true.
    void run(std::istream& in, std::ostream& out, const std::atomic<bool>* stop = nullptr);

    const ToolContext& context() const { return ctx_; }

private:
    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_tools_list() const;
    nlohmann::json handle_tools_call(const nlohmann::json& params);

    const ToolRegistry& registry_;
    ToolContext ctx_;
    bool log_calls_;
};

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

// Serialize a frame on one line. Invalid UTF-8 in tool output is replaced
// rather than thrown on.
std::string encode_frame(const nlohmann::json& frame);

} // namespace toolhost
