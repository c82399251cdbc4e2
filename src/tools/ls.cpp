#include "ls.hpp"
#include "tool_util.hpp"
#include "../limits.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>

namespace toolhost {

namespace {

struct ListOptions {
    bool show_hidden = false;
    bool recursive = false;
};

struct ListEntry {
    std::string name;
    std::string indent;
    bool is_dir = false;
    uintmax_t size = 0;
};

// Returns an IoError result when any directory in the walk cannot be read.
std::optional<ToolResult> list_directory(const std::filesystem::path& dir,
                                         const std::string& indent,
                                         const ListOptions& opts, std::vector<ListEntry>& out) {
    std::error_code ec;
    std::vector<std::filesystem::directory_entry> entries;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return ToolResult{false, "Failed to list directory: " + dir.string() + ": " + ec.message(),
                          ToolError::IoError};
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    for (const auto& entry : entries) {
        std::string name = entry.path().filename().string();
        if (!opts.show_hidden && !name.empty() && name[0] == '.') continue;

        ListEntry item;
        item.name = name;
        item.indent = indent;
        item.is_dir = entry.is_directory(ec);
        if (!item.is_dir) {
            item.size = entry.file_size(ec);
            if (ec) item.size = 0; // dangling symlink or special file
        }
        out.push_back(item);

        if (opts.recursive && item.is_dir && !entry.is_symlink(ec)) {
            if (auto err = list_directory(entry.path(), indent + "  ", opts, out)) return err;
        }
    }
    return std::nullopt;
}

} // namespace

ToolResult LsTool::execute(const nlohmann::json& args, const ToolContext& ctx) {
    if (auto err = require_object(args)) return *err;

    std::string path_arg = ".";
    ListOptions opts;
    bool as_array = false;
    if (auto err = optional_string(args, "path", path_arg)) return *err;
    if (auto err = optional_bool(args, "show_hidden", opts.show_hidden)) return *err;
    if (auto err = optional_bool(args, "recursive", opts.recursive)) return *err;
    if (auto err = optional_bool(args, "as_array", as_array)) return *err;

    auto path = resolve_path(ctx, path_arg);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ToolResult{false, "Path not found: " + path.string(), ToolError::NotFound};
    }

    if (!std::filesystem::is_directory(path, ec)) {
        auto size = std::filesystem::file_size(path, ec);
        if (ec) size = 0;
        return ToolResult{true, path.filename().string() + " (" + std::to_string(size) + " bytes)"};
    }

    std::vector<ListEntry> listing;
    if (auto err = list_directory(path, "", opts, listing)) return *err;

    if (as_array) {
        nlohmann::json names = nlohmann::json::array();
        for (const auto& item : listing) {
            if (names.size() >= kMaxArrayEntries) break;
            names.push_back(item.name);
        }
        return ToolResult{true, names.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
    }

    if (listing.empty()) {
        return ToolResult{true, "Empty directory"};
    }

    std::vector<std::string> lines;
    lines.reserve(listing.size());
    for (const auto& item : listing) {
        if (item.is_dir) {
            lines.push_back(item.indent + item.name + "/");
        } else {
            lines.push_back(item.indent + item.name + " (" + std::to_string(item.size) + " bytes)");
        }
    }
    return ToolResult{true, truncate_output(join(lines, "\n"))};
}

std::string LsTool::description() const {
    return "List a directory. Directories end with '/', files show their size in bytes. "
           "Hidden entries are skipped unless show_hidden is set. as_array returns a JSON "
           "array of names.";
}

std::string LsTool::parameters_json() const {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"Directory to list (default: working directory)"},"show_hidden":{"type":"boolean","description":"Include dot-prefixed entries"},"recursive":{"type":"boolean","description":"Descend into subdirectories"},"as_array":{"type":"boolean","description":"Return a JSON array of entry names"}}})json";
}

} // namespace toolhost
