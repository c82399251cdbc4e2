#include "config.hpp"
#include "dispatcher.hpp"
#include "http.hpp"
#include "mcp_server.hpp"
#include "tool.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

// No SA_RESTART, so a blocking read on stdin returns when a signal lands.
static void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static void print_usage() {
    std::cout << "Usage: toolhost [options]\n"
              << "\n"
              << "Serves the tool catalogue as an MCP server on stdin/stdout.\n"
              << "\n"
              << "Options:\n"
              << "  -C, --cwd DIR              Working directory for all tool calls\n"
              << "  --call NAME [ARGS_JSON]    Run one tool, print its result and exit\n"
              << "  --list                     List the available tools\n"
              << "  -v, --version              Show version\n"
              << "  -h, --help                 Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLHOST_WORKING_DIRECTORY  Working directory (overridden by --cwd)\n"
              << "  TOOLHOST_SHELL              Shell used by Bash (default: /bin/sh)\n"
              << "  TOOLHOST_RG_PATH            ripgrep binary used by Grep (default: rg)\n";
}

static int run_single_call(const std::string& name, const std::string& args_text,
                           const toolhost::ToolRegistry& registry,
                           const toolhost::ToolContext& ctx, bool log_calls) {
    toolhost::ToolCall call;
    call.name = name;
    if (!args_text.empty()) {
        call.arguments = nlohmann::json::parse(args_text, nullptr, false);
        if (call.arguments.is_discarded()) {
            std::cerr << "Error: ARGS_JSON is not valid JSON\n";
            return 1;
        }
    }
    auto response = toolhost::dispatch_tool(call, registry, ctx, log_calls);
    std::cout << response.text << "\n";
    return response.is_error ? 1 : 0;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string cwd_override;
    std::string call_name;
    std::string call_args;
    bool list_tools = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "toolhost " << TOOLHOST_VERSION << "\n";
            return 0;
        } else if ((std::strcmp(argv[i], "-C") == 0 || std::strcmp(argv[i], "--cwd") == 0) && i + 1 < argc) {
            cwd_override = argv[++i];
        } else if (std::strcmp(argv[i], "--call") == 0 && i + 1 < argc) {
            call_name = argv[++i];
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                call_args = argv[++i];
            }
        } else if (std::strcmp(argv[i], "--list") == 0) {
            list_tools = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    toolhost::http_init();
    auto config = toolhost::Config::load();
    if (!cwd_override.empty()) {
        config.working_directory = cwd_override;
    }
    auto ctx = config.tool_context();

    toolhost::CurlHttpClient http_client;
    toolhost::ToolRegistry registry(toolhost::create_builtin_tools(http_client));

    if (list_tools) {
        for (const auto& spec : registry.specs()) {
            std::cout << spec.name << "\n  " << spec.description << "\n";
        }
        toolhost::http_cleanup();
        return 0;
    }

    if (!call_name.empty()) {
        int rc = run_single_call(call_name, call_args, registry, ctx, config.log_tool_calls);
        toolhost::http_cleanup();
        return rc;
    }

    // Stdio server mode
    install_signal_handlers();
    toolhost::http_set_abort_flag(&g_shutdown);

    std::cerr << "[toolhost] toolhost " << TOOLHOST_VERSION << " serving on stdio\n";
    std::cerr << "[toolhost] Working directory: " << ctx.working_dir.string() << "\n";

    toolhost::McpServer server(registry, ctx, config.log_tool_calls);
    server.run(std::cin, std::cout, &g_shutdown);

    std::cerr << "[toolhost] Shutting down.\n";
    toolhost::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
