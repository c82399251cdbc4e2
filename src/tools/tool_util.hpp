#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

namespace toolhost {

inline ToolResult invalid_argument(const std::string& message) {
    return ToolResult{false, message, ToolError::InvalidArguments};
}

// Arguments must arrive as a JSON object (null is treated as {}).
inline std::optional<ToolResult> require_object(const nlohmann::json& args) {
    if (!args.is_object() && !args.is_null()) {
        return invalid_argument("Arguments must be a JSON object");
    }
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.is_object() || !args.contains(field) || !args[field].is_string()) {
        return invalid_argument(std::string("Missing required parameter: ") + field);
    }
    return std::nullopt;
}

// Optional fields: absent or null keeps the caller's default.
inline bool has_value(const nlohmann::json& args, const char* field) {
    return args.is_object() && args.contains(field) && !args[field].is_null();
}

inline std::optional<ToolResult> optional_string(const nlohmann::json& args, const char* field,
                                                 std::string& out) {
    if (!has_value(args, field)) return std::nullopt;
    if (!args[field].is_string()) {
        return invalid_argument(std::string("Parameter must be a string: ") + field);
    }
    out = args[field].get<std::string>();
    return std::nullopt;
}

inline std::optional<ToolResult> optional_bool(const nlohmann::json& args, const char* field,
                                               bool& out) {
    if (!has_value(args, field)) return std::nullopt;
    if (!args[field].is_boolean()) {
        return invalid_argument(std::string("Parameter must be a boolean: ") + field);
    }
    out = args[field].get<bool>();
    return std::nullopt;
}

inline std::optional<ToolResult> optional_int(const nlohmann::json& args, const char* field,
                                              int64_t& out) {
    if (!has_value(args, field)) return std::nullopt;
    const auto& v = args[field];
    constexpr auto kMax = std::numeric_limits<int64_t>::max();
    constexpr auto kMin = std::numeric_limits<int64_t>::min();
    if (v.is_number_unsigned()) {
        // Values past int64 clamp to the maximum so range checks still see them as too large
        auto u = v.get<uint64_t>();
        out = u > static_cast<uint64_t>(kMax) ? kMax : static_cast<int64_t>(u);
    } else if (v.is_number_integer()) {
        out = v.get<int64_t>();
    } else if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isnan(d)) {
            return invalid_argument(std::string("Parameter must be a number: ") + field);
        }
        // 2^63 is exactly representable; anything at or past it is out of range
        if (d >= 9223372036854775808.0) {
            out = kMax;
        } else if (d < -9223372036854775808.0) {
            out = kMin;
        } else {
            out = static_cast<int64_t>(d);
        }
    } else {
        return invalid_argument(std::string("Parameter must be a number: ") + field);
    }
    return std::nullopt;
}

// Resolve a path argument against the working directory.
// Absolute paths are kept; the result is lexically normalized.
inline std::filesystem::path resolve_path(const ToolContext& ctx, const std::string& path) {
    std::filesystem::path p(path);
    std::filesystem::path abs = p.is_absolute() ? p : ctx.working_dir / p;
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_relative_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

inline bool read_whole_file(const std::filesystem::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return !file.bad();
}

inline bool write_whole_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;
    file << content;
    file.close();
    return !file.fail();
}

} // namespace toolhost
