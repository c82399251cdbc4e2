#pragma once
#include <nlohmann/json.hpp>
#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

class HttpClient;

// The fixed tool catalogue, in advertised order.
enum class ToolId {
    Read,
    Write,
    Edit,
    Glob,
    Grep,
    Bash,
    LS,
    TodoWrite,
    WebFetch,
};

constexpr std::array<ToolId, 9> kAllToolIds = {
    ToolId::Read, ToolId::Write, ToolId::Edit, ToolId::Glob, ToolId::Grep,
    ToolId::Bash, ToolId::LS, ToolId::TodoWrite, ToolId::WebFetch,
};

// Wire name of a tool ("Read", "Write", ...)
const char* tool_id_name(ToolId id);

// Reverse lookup; nullopt for names outside the catalogue
std::optional<ToolId> tool_id_from_name(const std::string& name);

enum class ToolError {
    None,
    InvalidArguments,
    NotFound,
    PatternNotFound,
    Dangerous,
    TimeoutExceeded,
    ProcessSpawnFailure,
    NonZeroExit,
    HttpFailure,
    IoError,
    UnknownTool,
};

const char* tool_error_name(ToolError error);

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output;
    ToolError error = ToolError::None;
};

// Per-call environment. Relative paths resolve against working_dir.
struct ToolContext {
    std::filesystem::path working_dir;
    std::string shell = "/bin/sh";
    std::string rg_path = "rg";
    long web_timeout_seconds = 30;
    std::string user_agent = "toolhost/1.0";
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const nlohmann::json& args, const ToolContext& ctx) = 0;
    virtual ToolId tool_id() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    std::string tool_name() const { return tool_id_name(tool_id()); }

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Create all built-in tools, one per ToolId. WebFetch uses http.
std::vector<std::unique_ptr<Tool>> create_builtin_tools(HttpClient& http);

} // namespace toolhost
