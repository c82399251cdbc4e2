#include "config.hpp"
#include "util.hpp"
#include "version.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace toolhost {

static std::string default_user_agent() {
    return std::string("toolhost/") + TOOLHOST_VERSION;
}

nlohmann::json Config::defaults_json() {
    return {
        {"working_directory", ""},
        {"shell", "/bin/sh"},
        {"rg_path", "rg"},
        {"web", {
            {"timeout_seconds", 30},
            {"user_agent", default_user_agent()}
        }},
        {"log_tool_calls", true}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("working_directory") && j["working_directory"].is_string())
        cfg.working_directory = j["working_directory"].get<std::string>();
    if (j.contains("shell") && j["shell"].is_string() &&
        !j["shell"].get<std::string>().empty())
        cfg.shell = j["shell"].get<std::string>();
    if (j.contains("rg_path") && j["rg_path"].is_string() &&
        !j["rg_path"].get<std::string>().empty())
        cfg.rg_path = j["rg_path"].get<std::string>();
    if (j.contains("log_tool_calls") && j["log_tool_calls"].is_boolean())
        cfg.log_tool_calls = j["log_tool_calls"].get<bool>();

    if (j.contains("web") && j["web"].is_object()) {
        auto& w = j["web"];
        if (w.contains("timeout_seconds") && w["timeout_seconds"].is_number_integer() &&
            w["timeout_seconds"].get<long>() > 0)
            cfg.web.timeout_seconds = w["timeout_seconds"].get<long>();
        if (w.contains("user_agent") && w["user_agent"].is_string())
            cfg.web.user_agent = w["user_agent"].get<std::string>();
    }
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.toolhost/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original && original.is_object()) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << config_path
                      << " (" << e.what() << ")\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        } else {
            std::cerr << "[config] Could not write default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("TOOLHOST_WORKING_DIRECTORY"))
        working_directory = v;
    if (const char* v = std::getenv("TOOLHOST_SHELL"); v && *v)
        shell = v;
    if (const char* v = std::getenv("TOOLHOST_RG_PATH"); v && *v)
        rg_path = v;
}

ToolContext Config::tool_context() const {
    namespace fs = std::filesystem;
    ToolContext ctx;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (working_directory.empty()) {
        ctx.working_dir = cwd;
    } else {
        fs::path dir(expand_home(working_directory));
        ctx.working_dir = dir.is_absolute() ? dir : cwd / dir;
    }
    ctx.working_dir = ctx.working_dir.lexically_normal();
    if (!ctx.working_dir.has_filename() && ctx.working_dir.has_relative_path()) {
        ctx.working_dir = ctx.working_dir.parent_path();
    }
    ctx.shell = shell;
    ctx.rg_path = rg_path;
    ctx.web_timeout_seconds = web.timeout_seconds;
    ctx.user_agent = web.user_agent.empty() ? default_user_agent() : web.user_agent;
    return ctx;
}

} // namespace toolhost
