#include <catch2/catch_test_macros.hpp>
#include "dispatcher.hpp"
#include "mock_http_client.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace toolhost;
using nlohmann::json;

// A tool whose descriptor and behavior the test controls
class FakeTool : public Tool {
public:
    ToolId id = ToolId::TodoWrite;
    std::string schema = R"({"type":"object"})";
    bool throws = false;
    ToolResult next{true, "fake ok"};

    ToolResult execute(const json&, const ToolContext&) override {
        if (throws) throw std::runtime_error("boom");
        return next;
    }
    ToolId tool_id() const override { return id; }
    std::string description() const override { return "fake"; }
    std::string parameters_json() const override { return schema; }
};

static std::vector<std::unique_ptr<Tool>> one_tool(std::unique_ptr<FakeTool> tool) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::move(tool));
    return tools;
}

// ── Registry ─────────────────────────────────────────────────────

TEST_CASE("ToolRegistry: built-in catalogue in order", "[dispatcher]") {
    MockHttpClient http;
    ToolRegistry registry(create_builtin_tools(http));
    REQUIRE(registry.size() == kAllToolIds.size());

    auto specs = registry.specs();
    std::vector<std::string> names;
    for (const auto& s : specs) names.push_back(s.name);
    REQUIRE(names == std::vector<std::string>{
        "Read", "Write", "Edit", "Glob", "Grep", "Bash", "LS", "TodoWrite", "WebFetch"});

    for (const auto& s : specs) {
        auto schema = json::parse(s.parameters_json);
        REQUIRE(schema["type"] == "object");
        REQUIRE_FALSE(s.description.empty());
    }
}

TEST_CASE("ToolRegistry: find by name and id", "[dispatcher]") {
    MockHttpClient http;
    ToolRegistry registry(create_builtin_tools(http));
    REQUIRE(registry.find("Bash") != nullptr);
    REQUIRE(registry.find("Bash") == registry.find(ToolId::Bash));
    REQUIRE(registry.find("bash") == nullptr);
    REQUIRE(registry.find("Unknown") == nullptr);
}

TEST_CASE("ToolRegistry: rejects duplicate ids", "[dispatcher]") {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<FakeTool>());
    tools.push_back(std::make_unique<FakeTool>());
    REQUIRE_THROWS_AS(ToolRegistry(std::move(tools)), std::invalid_argument);
}

TEST_CASE("ToolRegistry: rejects non-object schema", "[dispatcher]") {
    auto tool = std::make_unique<FakeTool>();
    tool->schema = R"({"type":"array"})";
    REQUIRE_THROWS_AS(ToolRegistry(one_tool(std::move(tool))), std::invalid_argument);

    auto broken = std::make_unique<FakeTool>();
    broken->schema = "{not json";
    REQUIRE_THROWS_AS(ToolRegistry(one_tool(std::move(broken))), std::invalid_argument);
}

TEST_CASE("tool_id_from_name: round trip", "[dispatcher]") {
    for (ToolId id : kAllToolIds) {
        auto back = tool_id_from_name(tool_id_name(id));
        REQUIRE(back.has_value());
        REQUIRE(*back == id);
    }
    REQUIRE_FALSE(tool_id_from_name("read").has_value());
}

// ── dispatch_tool ────────────────────────────────────────────────

TEST_CASE("dispatch_tool: unknown tool", "[dispatcher]") {
    MockHttpClient http;
    ToolRegistry registry(create_builtin_tools(http));
    auto response = dispatch_tool(ToolCall{"Nope", json::object()}, registry, ToolContext{});
    REQUIRE(response.is_error);
    REQUIRE(response.text == "Error: Unknown tool: Nope");
}

TEST_CASE("dispatch_tool: success passes text through", "[dispatcher]") {
    ToolRegistry registry(one_tool(std::make_unique<FakeTool>()));
    auto response = dispatch_tool(ToolCall{"TodoWrite", json::object()}, registry, ToolContext{});
    REQUIRE_FALSE(response.is_error);
    REQUIRE(response.text == "fake ok");
}

TEST_CASE("dispatch_tool: failure gets Error prefix", "[dispatcher]") {
    auto tool = std::make_unique<FakeTool>();
    tool->next = ToolResult{false, "bad thing", ToolError::IoError};
    ToolRegistry registry(one_tool(std::move(tool)));
    auto response = dispatch_tool(ToolCall{"TodoWrite", json::object()}, registry, ToolContext{});
    REQUIRE(response.is_error);
    REQUIRE(response.text == "Error: bad thing");
}

TEST_CASE("dispatch_tool: escaping exception becomes an error envelope", "[dispatcher]") {
    auto tool = std::make_unique<FakeTool>();
    tool->throws = true;
    ToolRegistry registry(one_tool(std::move(tool)));
    auto response = dispatch_tool(ToolCall{"TodoWrite", json::object()}, registry, ToolContext{});
    REQUIRE(response.is_error);
    REQUIRE(response.text.find("boom") != std::string::npos);
}

TEST_CASE("dispatch_tool: error text capped at 30000", "[dispatcher]") {
    auto tool = std::make_unique<FakeTool>();
    tool->next = ToolResult{false, std::string(40000, 'e'), ToolError::NonZeroExit};
    ToolRegistry registry(one_tool(std::move(tool)));
    auto response = dispatch_tool(ToolCall{"TodoWrite", json::object()}, registry, ToolContext{});
    REQUIRE(response.is_error);
    REQUIRE(response.text.size() == 30000);
    REQUIRE(response.text.rfind("Error: ", 0) == 0);
}

TEST_CASE("dispatch_tool: real handler end to end", "[dispatcher]") {
    TempDir dir;
    REQUIRE(dir.ok());
    MockHttpClient http;
    ToolRegistry registry(create_builtin_tools(http));
    auto ctx = dir.context();

    auto wrote = dispatch_tool(ToolCall{"Write", {{"file_path", "n.txt"}, {"content", "hi"}}},
                               registry, ctx);
    REQUIRE_FALSE(wrote.is_error);

    auto read = dispatch_tool(ToolCall{"Read", {{"file_path", "n.txt"}}}, registry, ctx);
    REQUIRE_FALSE(read.is_error);
    REQUIRE(read.text == "    1\xe2\x86\x92hi");

    auto missing = dispatch_tool(ToolCall{"Read", {{"file_path", "gone.txt"}}}, registry, ctx);
    REQUIRE(missing.is_error);
    REQUIRE(missing.text == "Error: File not found: " + (dir.path() / "gone.txt").string());
}

TEST_CASE("dispatch_tool: non-object arguments are invalid", "[dispatcher]") {
    TempDir dir;
    MockHttpClient http;
    ToolRegistry registry(create_builtin_tools(http));
    auto response = dispatch_tool(ToolCall{"LS", json::array()}, registry, dir.context());
    REQUIRE(response.is_error);
    REQUIRE(response.text == "Error: Arguments must be a JSON object");
}
