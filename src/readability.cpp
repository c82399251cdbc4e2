#include "readability.hpp"
#include "util.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <memory>
#include <unordered_map>
#include <vector>

namespace toolhost {

namespace {

struct DocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;

std::string node_name(const xmlNode* node) {
    return node->name ? to_lower(reinterpret_cast<const char*>(node->name)) : std::string();
}

std::string attr(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return "";
    std::string out(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return out;
}

bool is_element(const xmlNode* node) {
    return node && node->type == XML_ELEMENT_NODE;
}

bool contains_any(const std::string& haystack, const std::vector<const char*>& needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

const std::vector<const char*> kUnlikely = {
    "comment", "sidebar", "footer", "footnote", "menu", "nav", "share", "social",
    "sponsor", "advert", "ad-break", "popup", "banner", "cookie", "related",
    "remark", "rss", "shoutbox", "combx", "disqus", "pagination", "pager", "masthead",
};
const std::vector<const char*> kMaybe = {
    "article", "body", "column", "content", "main", "shadow", "post", "story", "text",
};
const std::vector<const char*> kPositive = {
    "article", "body", "content", "entry", "hentry", "main", "page", "post", "text",
    "blog", "story",
};
const std::vector<const char*> kNegative = {
    "hidden", "banner", "combx", "comment", "com-", "contact", "foot", "footer",
    "footnote", "masthead", "media", "meta", "outbrain", "promo", "related", "scroll",
    "share", "shoutbox", "sidebar", "skyscraper", "sponsor", "shopping", "tags",
    "tool", "widget",
};
const std::vector<const char*> kBylineHints = {
    "byline", "author", "dateline", "writtenby", "p-author",
};

std::string class_and_id(const xmlNode* node) {
    return to_lower(attr(node, "class") + " " + attr(node, "id"));
}

// Elements whose text never belongs to the article.
bool is_noise_tag(const std::string& name) {
    static const char* tags[] = {
        "script", "style", "noscript", "template", "iframe", "object", "embed",
        "svg", "canvas", "form", "button", "input", "select", "textarea", "nav",
        "footer", "aside", "head",
    };
    for (const char* t : tags) {
        if (name == t) return true;
    }
    return false;
}

bool is_unlikely_candidate(const xmlNode* node) {
    std::string name = node_name(node);
    if (name == "body" || name == "a" || name == "article" || name == "main") return false;
    std::string hints = class_and_id(node);
    if (hints.size() <= 1) return false;
    return contains_any(hints, kUnlikely) && !contains_any(hints, kMaybe);
}

bool is_skipped(const xmlNode* node) {
    return is_noise_tag(node_name(node)) || is_unlikely_candidate(node);
}

bool is_block_tag(const std::string& name) {
    static const char* tags[] = {
        "p", "div", "section", "article", "main", "header", "h1", "h2", "h3", "h4",
        "h5", "h6", "ul", "ol", "li", "pre", "blockquote", "table", "tr", "dl", "dt",
        "dd", "figure", "figcaption", "hr", "address",
    };
    for (const char* t : tags) {
        if (name == t) return true;
    }
    return false;
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_space = false;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += c;
    }
    if (in_space && !out.empty()) out += ' ';
    return out;
}

// Inline text of a subtree, whitespace collapsed, noise skipped.
void gather_inline(const xmlNode* node, std::string& out) {
    for (const xmlNode* child = node->children; child; child = child->next) {
        if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
            if (child->content) out += reinterpret_cast<const char*>(child->content);
        } else if (is_element(child) && !is_noise_tag(node_name(child))) {
            if (node_name(child) == "br") out += ' ';
            gather_inline(child, out);
        }
    }
}

std::string inner_text(const xmlNode* node) {
    std::string raw;
    gather_inline(node, raw);
    return trim(collapse_spaces(raw));
}

void ensure_break(std::string& out, size_t want) {
    while (!out.empty() && out.back() == ' ') out.pop_back();
    if (out.empty()) return;
    size_t have = 0;
    while (have < out.size() && out[out.size() - 1 - have] == '\n') ++have;
    for (; have < want; ++have) out += '\n';
}

// Block-structured text: paragraphs separated by blank lines, list items
// and rows by single newlines.
void gather_blocks(const xmlNode* node, std::string& out) {
    for (const xmlNode* child = node->children; child; child = child->next) {
        if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
            if (!child->content) continue;
            std::string text = collapse_spaces(reinterpret_cast<const char*>(child->content));
            bool at_gap = out.empty() || out.back() == '\n' || out.back() == ' ';
            if (at_gap && !text.empty() && text.front() == ' ') text.erase(0, 1);
            out += text;
            continue;
        }
        if (!is_element(child) || is_skipped(child)) continue;
        std::string name = node_name(child);
        if (name == "br") {
            ensure_break(out, 1);
            continue;
        }
        bool block = is_block_tag(name);
        size_t brk = (name == "li" || name == "tr" || name == "dt" || name == "dd") ? 1 : 2;
        if (block) ensure_break(out, brk);
        gather_blocks(child, out);
        if (block) ensure_break(out, brk);
    }
}

std::string block_text(const xmlNode* node) {
    std::string raw;
    gather_blocks(node, raw);
    std::vector<std::string> lines;
    for (auto& line : split(raw, '\n')) {
        lines.push_back(trim(line));
    }
    // Collapse runs of blank lines to one.
    std::string out;
    bool blank = false;
    for (auto& line : lines) {
        if (line.empty()) {
            blank = !out.empty();
            continue;
        }
        if (!out.empty()) out += blank ? "\n\n" : "\n";
        out += line;
        blank = false;
    }
    return out;
}

const xmlNode* find_first(const xmlNode* node, const std::string& name) {
    for (const xmlNode* child = node ? node->children : nullptr; child; child = child->next) {
        if (!is_element(child)) continue;
        if (node_name(child) == name) return child;
        if (auto* found = find_first(child, name)) return found;
    }
    return nullptr;
}

void collect(const xmlNode* node, const std::vector<std::string>& names,
             std::vector<const xmlNode*>& out, bool skip_noise) {
    for (const xmlNode* child = node->children; child; child = child->next) {
        if (!is_element(child)) continue;
        if (skip_noise && is_skipped(child)) continue;
        std::string name = node_name(child);
        if (std::find(names.begin(), names.end(), name) != names.end()) {
            out.push_back(child);
        }
        collect(child, names, out, skip_noise);
    }
}

// <meta name=..> / <meta property=..> content, first match among keys.
std::string meta_content(const xmlNode* root, const std::vector<std::string>& keys) {
    std::vector<const xmlNode*> metas;
    collect(root, {"meta"}, metas, false);
    for (const auto& key : keys) {
        for (const xmlNode* meta : metas) {
            std::string name = to_lower(attr(meta, "name"));
            std::string prop = to_lower(attr(meta, "property"));
            if (name == key || prop == key) {
                std::string content = trim(collapse_spaces(attr(meta, "content")));
                if (!content.empty()) return content;
            }
        }
    }
    return "";
}

std::string find_title(const xmlNode* root) {
    std::string title = meta_content(root, {"og:title", "twitter:title"});
    if (!title.empty()) return title;
    if (const xmlNode* t = find_first(root, "title")) {
        title = inner_text(t);
    }
    if (title.empty()) {
        if (const xmlNode* h1 = find_first(root, "h1")) title = inner_text(h1);
    }
    return title;
}

std::string find_byline(const xmlNode* root) {
    std::string byline = meta_content(root, {"author", "article:author"});
    if (!byline.empty()) return byline;

    std::vector<const xmlNode*> all;
    collect(root, {"a", "span", "div", "p", "address", "cite"}, all, false);
    for (const xmlNode* node : all) {
        bool rel_author = to_lower(attr(node, "rel")) == "author" ||
                          to_lower(attr(node, "itemprop")).find("author") != std::string::npos;
        if (!rel_author && !contains_any(class_and_id(node), kBylineHints)) continue;
        std::string text = inner_text(node);
        if (!text.empty() && utf8_length(text) < 100) return text;
    }
    return "";
}

double class_weight(const xmlNode* node) {
    double weight = 0;
    std::string cls = to_lower(attr(node, "class"));
    std::string id = to_lower(attr(node, "id"));
    if (!cls.empty()) {
        if (contains_any(cls, kNegative)) weight -= 25;
        if (contains_any(cls, kPositive)) weight += 25;
    }
    if (!id.empty()) {
        if (contains_any(id, kNegative)) weight -= 25;
        if (contains_any(id, kPositive)) weight += 25;
    }
    return weight;
}

double initial_score(const xmlNode* node) {
    std::string name = node_name(node);
    double score = 0;
    if (name == "div" || name == "article" || name == "main" || name == "section") {
        score = 5;
    } else if (name == "pre" || name == "td" || name == "blockquote") {
        score = 3;
    } else if (name == "address" || name == "ol" || name == "ul" || name == "dl" ||
               name == "dd" || name == "dt" || name == "li" || name == "form") {
        score = -3;
    } else if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6') {
        score = -5;
    } else if (name == "th") {
        score = -5;
    }
    return score + class_weight(node);
}

// Share of a node's text that sits inside links.
double link_density(const xmlNode* node) {
    size_t total = utf8_length(inner_text(node));
    if (total == 0) return 0;
    std::vector<const xmlNode*> links;
    collect(node, {"a"}, links, true);
    size_t linked = 0;
    for (const xmlNode* a : links) linked += utf8_length(inner_text(a));
    return static_cast<double>(linked) / static_cast<double>(total);
}

const xmlNode* pick_top_candidate(const xmlNode* body) {
    std::vector<const xmlNode*> paragraphs;
    collect(body, {"p", "pre", "td", "blockquote"}, paragraphs, true);

    std::unordered_map<const xmlNode*, double> scores;
    std::vector<const xmlNode*> order;
    auto score_of = [&](const xmlNode* n) -> double& {
        auto it = scores.find(n);
        if (it == scores.end()) {
            order.push_back(n);
            it = scores.emplace(n, initial_score(n)).first;
        }
        return it->second;
    };

    for (const xmlNode* p : paragraphs) {
        std::string text = inner_text(p);
        size_t len = utf8_length(text);
        if (len < 25) continue;

        double content_score = 1;
        content_score += static_cast<double>(std::count(text.begin(), text.end(), ','));
        content_score += std::min<double>(static_cast<double>(len / 100), 3);

        const xmlNode* parent = p->parent;
        if (is_element(parent)) {
            score_of(parent) += content_score;
            const xmlNode* grand = parent->parent;
            if (is_element(grand) && node_name(grand) != "html") {
                score_of(grand) += content_score / 2;
            }
        }
    }

    const xmlNode* best = nullptr;
    double best_score = 0;
    for (const xmlNode* n : order) {
        double adjusted = scores[n] * (1 - link_density(n));
        if (!best || adjusted > best_score) {
            best = n;
            best_score = adjusted;
        }
    }
    return best;
}

} // namespace

std::optional<Article> extract_article(const std::string& html, const std::string& url) {
    if (html.empty()) return std::nullopt;

    DocPtr doc(htmlReadMemory(html.data(), static_cast<int>(html.size()), url.c_str(), nullptr,
                              HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                              HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
    if (!doc) return std::nullopt;

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) return std::nullopt;

    const xmlNode* body = find_first(root, "body");
    if (!body) body = root;

    const xmlNode* content = pick_top_candidate(body);
    if (!content) content = body;

    Article article;
    article.text_content = block_text(content);
    if (article.text_content.empty() && content != body) {
        article.text_content = block_text(body);
    }
    if (article.text_content.empty()) return std::nullopt;

    article.title = find_title(root);
    article.byline = find_byline(root);
    article.excerpt = meta_content(root, {"description", "og:description", "twitter:description"});
    if (article.excerpt.empty()) {
        std::vector<const xmlNode*> paragraphs;
        collect(content, {"p"}, paragraphs, true);
        for (const xmlNode* p : paragraphs) {
            std::string text = inner_text(p);
            if (!text.empty()) {
                article.excerpt = text;
                break;
            }
        }
    }
    article.length = utf8_length(article.text_content);
    return article;
}

} // namespace toolhost
