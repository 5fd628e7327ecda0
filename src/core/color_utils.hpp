/**
 * @file    color_utils.hpp
 * @brief   Image sampling and color distance primitives
 * @license MIT
 *
 * @details
 * Shared by palette extraction, brand color verification and logo
 * detection. All rasters entering the gate pass through here, so this is
 * where undecodable or empty images are rejected with InvalidImageError.
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ccg {

/**
 * Ordered shades of one brand color: darkest first, the unshifted color in
 * the middle, lightest last.
 */
using ShadeSet = std::vector<ColorSample>;

/**
 * Parse "#RRGGBB" (leading '#' optional, hex digits case-insensitive)
 *
 * @throws ConfigurationError if the string is not a 6-digit hex color
 */
ColorSample parse_hex_color(std::string_view hex);

/**
 * Format as "#RRGGBB" (uppercase)
 */
std::string to_hex(const ColorSample& color);

/**
 * Euclidean distance in RGB space
 */
[[nodiscard]] inline double color_distance(const ColorSample& a, const ColorSample& b) noexcept {
    const double dr = static_cast<double>(a.r) - b.r;
    const double dg = static_cast<double>(a.g) - b.g;
    const double db = static_cast<double>(a.b) - b.b;
    return std::sqrt(dr * dr + dg * dg + db * db);
}

/**
 * Build the shade set for a brand color.
 *
 * Shade i (i = -steps..steps) adds i * step to every channel, clamped to
 * [0, 255]. The result has 2 * steps + 1 entries and entry `steps` is the
 * input color. Channels are non-decreasing from first to last entry.
 */
ShadeSet make_shade_set(const ColorSample& color, int steps = 5, int step = 15);

/**
 * Decode an encoded image (PNG, JPEG, WebP, ...) keeping any alpha channel
 *
 * @throws InvalidImageError if the bytes cannot be decoded
 */
cv::Mat decode_image(const std::vector<std::uint8_t>& bytes);

/**
 * Read and decode an image file keeping any alpha channel
 *
 * @throws InvalidImageError if the file is missing or cannot be decoded
 */
cv::Mat load_image(const std::filesystem::path& path);

/**
 * Normalize a raster to 8-bit BGR (1/3/4 channels, 8 or 16 bit accepted).
 * Alpha is dropped.
 *
 * @throws InvalidImageError on empty input or unsupported layout
 */
cv::Mat to_bgr8(const cv::Mat& image);

/**
 * Normalize a raster to single-channel float [0, 1]
 *
 * @throws InvalidImageError on empty input or unsupported layout
 */
cv::Mat to_gray_f32(const cv::Mat& image);

/**
 * Sample up to `max_samples` opaque pixels on a regular grid.
 *
 * Grid sampling keeps exact pixel values (no interpolation), so an image
 * made of N flat colors yields samples of exactly those N colors.
 * Pixels with alpha == 0 are skipped.
 *
 * @throws InvalidImageError if the image is empty or fully transparent
 */
std::vector<ColorSample> sample_pixels(const cv::Mat& image, int max_samples);

}  // namespace ccg
