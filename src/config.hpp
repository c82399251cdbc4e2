#pragma once
#include "tool.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace toolhost {

struct WebConfig {
    long timeout_seconds = 30;
    std::string user_agent;  // empty = "toolhost/<version>"
};

struct Config {
    std::string working_directory;  // empty = process cwd at startup
    std::string shell = "/bin/sh";
    std::string rg_path = "rg";
    WebConfig web;
    bool log_tool_calls = true;

    // Load from ~/.toolhost/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars. A missing file is created
    // with defaults; an existing one gains any new default keys.
    static Config load_from(const std::string& config_path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Read known keys; wrong-typed values keep their defaults
    static Config from_json(const nlohmann::json& j);

    // TOOLHOST_* environment variables override the file
    void apply_env();

    // Per-call context for tools; working directory made absolute
    ToolContext tool_context() const;
};

} // namespace toolhost
