#include "web_fetch.hpp"
#include "tool_util.hpp"
#include "../http.hpp"
#include "../limits.hpp"

namespace toolhost {

static const char* const kTruncatedMarker = "\n\n[Content truncated due to length]";

std::string format_web_fetch(const std::string& url, const Article& article) {
    std::string text = "WebFetch Results for " + url + ":\n\n";
    text += "Title: " + article.title + "\n";
    text += "Byline: " + (article.byline.empty() ? std::string("N/A") : article.byline) + "\n";
    text += "Excerpt: " + (article.excerpt.empty() ? std::string("N/A") : article.excerpt) + "\n";
    text += "Length: " + std::to_string(article.length) + " characters\n\n";
    text += "Plain Text Content:\n" + article.text_content;
    return truncate_with_marker(text, kTruncatedMarker);
}

ToolResult WebFetchTool::execute(const nlohmann::json& args, const ToolContext& ctx) {
    if (auto err = require_object(args)) return *err;
    if (auto err = require_string(args, "url")) return *err;

    std::string url = args["url"].get<std::string>();
    if (url.empty()) return invalid_argument("url must not be empty");

    auto response = http_.get(url, {{"User-Agent", ctx.user_agent},
                                    {"Accept", "text/html,application/xhtml+xml,*/*;q=0.8"}},
                              ctx.web_timeout_seconds);
    if (response.status_code == 0) {
        return ToolResult{false, truncate_output("Failed to fetch " + url + ": " + response.error),
                          ToolError::HttpFailure};
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        std::string msg = "HTTP " + std::to_string(response.status_code) + ": " + response.reason;
        return ToolResult{false, truncate_output(msg), ToolError::HttpFailure};
    }

    auto article = extract_article(response.body, url);
    if (!article) {
        return ToolResult{true, truncate_output(
            "WebFetch: Could not extract article content from " + url +
            ". The page may not contain readable content.")};
    }
    return ToolResult{true, format_web_fetch(url, *article)};
}

std::string WebFetchTool::description() const {
    return "Fetch a web page and return its main article as plain text, with title, "
           "byline and excerpt.";
}

std::string WebFetchTool::parameters_json() const {
    return R"json({"type":"object","properties":{"url":{"type":"string","description":"Absolute http(s) URL to fetch"}},"required":["url"]})json";
}

} // namespace toolhost
