/**
 * @file    types.hpp
 * @brief   Shared type definitions for Creative Compliance Gate
 * @license MIT
 */

#pragma once

#include <compare>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ccg {

// Version info
#ifdef CCG_VERSION
inline constexpr const char* kVersion = CCG_VERSION;
#else
inline constexpr const char* kVersion = "0.3.0";
#endif

// =============================================================================
// Errors
// =============================================================================

/**
 * Raster cannot be decoded, is empty, or has no opaque pixels.
 * Raised by palette extraction and logo detection.
 */
class InvalidImageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Malformed term table, brand spec, brief or gate configuration.
 * Raised at setup; fatal to the campaign run.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// Colors
// =============================================================================

/**
 * RGB triple in [0,255]^3 (note: OpenCV rasters are BGR)
 */
struct ColorSample {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    auto operator<=>(const ColorSample&) const = default;
};

// =============================================================================
// Legal severity
// =============================================================================

/**
 * Severity tiers, totally ordered: Error > Warning.
 * Blocking policy is "max severity >= kBlockingSeverity".
 */
enum class Severity : int {
    Warning = 1,
    Error   = 2,
};

inline constexpr Severity kBlockingSeverity = Severity::Error;

[[nodiscard]] constexpr const char* to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Warning: return "WARNING";
        case Severity::Error:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

/**
 * Parse "ERROR" / "WARNING" (case-insensitive)
 * @throws ConfigurationError on any other value
 */
Severity parse_severity(std::string_view text);

}  // namespace ccg
