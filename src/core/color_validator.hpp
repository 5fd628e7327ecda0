/**
 * @file    color_validator.hpp
 * @brief   Brand color verification against an image's dominant palette
 * @license MIT
 */

#pragma once

#include "core/brand_spec.hpp"
#include "core/color_utils.hpp"
#include "core/gate_config.hpp"
#include "core/palette_extractor.hpp"

#include <opencv2/core.hpp>
#include <limits>
#include <set>

namespace ccg {

/**
 * Outcome for one brand color
 */
struct BrandColorMatch {
    ColorSample color;                 // Brand color as specified
    bool present = false;
    double closest_distance = std::numeric_limits<double>::infinity();
    double coverage = 0.0;             // Summed weight of matching clusters
    std::set<ColorSample> matched_shades;
};

struct ColorCheckResult {
    bool pass = false;                 // Primary AND secondary present
    std::set<ColorSample> matched;     // Union of matched shades
    BrandColorMatch primary;
    BrandColorMatch secondary;
    Palette palette;
};

class ColorComplianceValidator {
public:
    ColorComplianceValidator(ColorConfig color_config = {}, PaletteConfig palette_config = {});

    /**
     * Check that both brand colors appear in the image's dominant palette.
     *
     * A brand color is present when any of its shades lies within
     * color_tolerance of a palette centroid whose weight exceeds
     * min_cluster_weight. For every such centroid the closest shade is
     * recorded as matched.
     *
     * @throws InvalidImageError if the image is empty or fully transparent
     */
    [[nodiscard]] ColorCheckResult validate(const cv::Mat& image, const BrandSpec& brand) const;

    /**
     * Match one color against an already extracted palette
     */
    [[nodiscard]] BrandColorMatch match_color(const ColorSample& color, const Palette& palette) const;

private:
    ColorConfig config_;
    PaletteExtractor extractor_;
};

}  // namespace ccg
