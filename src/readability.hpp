#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace toolhost {

// Main content of an HTML page, as plain text plus metadata.
struct Article {
    std::string title;
    std::string byline;       // empty when the page names no author
    std::string excerpt;      // empty when neither a description nor a paragraph exists
    std::string text_content;
    size_t length = 0;        // characters (UTF-8 code points) in text_content
};

// Readability-style extraction: score block containers by the paragraphs
// they hold, pick the best one and flatten it to text. nullopt when the
// document has no readable text at all.
std::optional<Article> extract_article(const std::string& html, const std::string& url);

} // namespace toolhost
