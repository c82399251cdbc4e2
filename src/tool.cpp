#include "tool.hpp"
#include "tools/file_read.hpp"
#include "tools/file_write.hpp"
#include "tools/file_edit.hpp"
#include "tools/glob_tool.hpp"
#include "tools/grep.hpp"
#include "tools/bash.hpp"
#include "tools/ls.hpp"
#include "tools/todo_write.hpp"
#include "tools/web_fetch.hpp"

namespace toolhost {

const char* tool_id_name(ToolId id) {
    switch (id) {
        case ToolId::Read:      return "Read";
        case ToolId::Write:     return "Write";
        case ToolId::Edit:      return "Edit";
        case ToolId::Glob:      return "Glob";
        case ToolId::Grep:      return "Grep";
        case ToolId::Bash:      return "Bash";
        case ToolId::LS:        return "LS";
        case ToolId::TodoWrite: return "TodoWrite";
        case ToolId::WebFetch:  return "WebFetch";
    }
    return "";
}

std::optional<ToolId> tool_id_from_name(const std::string& name) {
    for (ToolId id : kAllToolIds) {
        if (name == tool_id_name(id)) return id;
    }
    return std::nullopt;
}

const char* tool_error_name(ToolError error) {
    switch (error) {
        case ToolError::None:                return "None";
        case ToolError::InvalidArguments:    return "InvalidArguments";
        case ToolError::NotFound:            return "NotFound";
        case ToolError::PatternNotFound:     return "PatternNotFound";
        case ToolError::Dangerous:           return "Dangerous";
        case ToolError::TimeoutExceeded:     return "TimeoutExceeded";
        case ToolError::ProcessSpawnFailure: return "ProcessSpawnFailure";
        case ToolError::NonZeroExit:         return "NonZeroExit";
        case ToolError::HttpFailure:         return "HttpFailure";
        case ToolError::IoError:             return "IoError";
        case ToolError::UnknownTool:         return "UnknownTool";
    }
    return "";
}

std::vector<std::unique_ptr<Tool>> create_builtin_tools(HttpClient& http) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<FileReadTool>());
    tools.push_back(std::make_unique<FileWriteTool>());
    tools.push_back(std::make_unique<FileEditTool>());
    tools.push_back(std::make_unique<GlobTool>());
    tools.push_back(std::make_unique<GrepTool>());
    tools.push_back(std::make_unique<BashTool>());
    tools.push_back(std::make_unique<LsTool>());
    tools.push_back(std::make_unique<TodoWriteTool>());
    tools.push_back(std::make_unique<WebFetchTool>(http));
    return tools;
}

} // namespace toolhost
