#pragma once
#include "../tool.hpp"
#include "../process.hpp"
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

class GrepTool : public Tool {
public:
    ToolResult execute(const nlohmann::json& args, const ToolContext& ctx) override;
    ToolId tool_id() const override { return ToolId::Grep; }
    std::string description() const override;
    std::string parameters_json() const override;
};

struct GrepOptions {
    std::string glob;
    std::string type;
    bool ignore_case = false;
    bool line_number = false;
    bool multiline = false;
    int64_t before = 0;
    int64_t after = 0;
    int64_t context = 0;
    std::string output_mode = "files_with_matches";
    int64_t head_limit = 0; // 0 = unlimited
};

// Parse the "options" object. Returns an error result on bad input.
std::optional<ToolResult> parse_grep_options(const nlohmann::json& options, GrepOptions& out);

// rg arguments (without the program name): flags, then "--", pattern and path
std::vector<std::string> build_rg_args(const std::string& pattern,
                                       const std::string& search_path,
                                       const GrepOptions& opts);

// Interpret a finished rg run. Exit 1 with empty stderr means "no matches".
ToolResult grep_result(const ProcessOutput& proc, const GrepOptions& opts,
                       const std::string& rg_path);

} // namespace toolhost
