/**
 * @file    path_formatter.hpp
 * @brief   Custom fmt formatter for std::filesystem::path with UTF-8 support
 * @license MIT
 *
 * @details
 * Lets spdlog/fmt print filesystem paths (brief, term table, creatives,
 * report) as UTF-8 on every platform, and resolves paths that a campaign
 * brief declares relative to the brief's own directory.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Loading brief: {}", brief_path);
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace ccg {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 *
 * C++20: u8string() returns std::u8string (char8_t), hence the cast.
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Build a path from a UTF-8 string read out of a JSON document
 */
inline std::filesystem::path path_from_utf8(std::string_view utf8_str) {
    std::u8string u8(utf8_str.begin(), utf8_str.end());
    return std::filesystem::path(u8);
}

/**
 * Resolve a path declared inside a document against the document's directory.
 * Absolute paths are returned unchanged.
 */
inline std::filesystem::path resolve_relative_to(
    const std::filesystem::path& document,
    std::string_view declared)
{
    std::filesystem::path p = path_from_utf8(declared);
    if (p.is_absolute()) return p;
    return document.parent_path() / p;
}

}  // namespace ccg

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
