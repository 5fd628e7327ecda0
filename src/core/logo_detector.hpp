/**
 * @file    logo_detector.hpp
 * @brief   Multi-scale logo detection by normalized cross-correlation
 * @license MIT
 *
 * @details
 * Slides the brand logo over the creative at a small set of scale factors
 * and keeps the best TM_CCOEFF_NORMED score. Work is bounded: the creative
 * is downscaled so its longest side is at most max_search_dimension, and
 * at most max_scales scale factors are evaluated.
 *
 * Known trade-off: tuned for near-exact placements; rotation and scales
 * outside the configured set are not searched.
 */

#pragma once

#include "core/gate_config.hpp"

#include <opencv2/core.hpp>
#include <optional>

namespace ccg {

/**
 * Logo detection result
 */
struct LogoMatch {
    bool found = false;                  // confidence >= threshold
    float confidence = 0.0f;             // Best NCC score clamped to [0, 1]
    std::optional<cv::Rect> location;    // Set only when found (creative coordinates)

    // Debug info
    double scale = 0.0;                  // Scale factor of the best match
    int scales_searched = 0;             // Scales that produced a score
};

class LogoDetector {
public:
    explicit LogoDetector(LogoConfig config = {});

    /**
     * Detect the logo using the configured threshold
     */
    [[nodiscard]] LogoMatch detect(const cv::Mat& image, const cv::Mat& logo) const;

    /**
     * Detect the logo in a creative
     *
     * A logo larger than the creative at every scale yields confidence 0
     * and found=false. "Not found" is a normal result, never an error.
     *
     * @param image      Creative (BGR, BGRA or grayscale)
     * @param logo       Logo reference; with an alpha channel it is cropped
     *                   to its opaque bounding box first
     * @param threshold  Minimum confidence for found=true
     * @throws InvalidImageError if either raster is empty or the logo has
     *         no opaque pixels
     */
    [[nodiscard]] LogoMatch detect(const cv::Mat& image, const cv::Mat& logo, double threshold) const;

    [[nodiscard]] const LogoConfig& config() const noexcept { return config_; }

private:
    LogoConfig config_;
};

}  // namespace ccg
