/**
 * @file    color_validator.cpp
 * @brief   Brand color verification against an image's dominant palette
 * @license MIT
 */

#include "core/color_validator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace ccg {

ColorComplianceValidator::ColorComplianceValidator(ColorConfig color_config, PaletteConfig palette_config)
    : config_(color_config)
    , extractor_(std::move(palette_config)) {}

BrandColorMatch ColorComplianceValidator::match_color(const ColorSample& color, const Palette& palette) const {
    BrandColorMatch match;
    match.color = color;

    const ShadeSet shades = make_shade_set(color, config_.shade_steps, config_.shade_step);

    for (const auto& entry : palette) {
        if (entry.weight <= config_.min_cluster_weight) continue;  // Noise-level cluster

        const ColorSample* best_shade = nullptr;
        double best_distance = std::numeric_limits<double>::infinity();
        for (const auto& shade : shades) {
            const double d = color_distance(shade, entry.color);
            if (d < best_distance) {
                best_distance = d;
                best_shade = &shade;
            }
        }

        match.closest_distance = std::min(match.closest_distance, best_distance);

        if (best_shade && best_distance <= config_.color_tolerance) {
            match.present = true;
            match.coverage += entry.weight;
            match.matched_shades.insert(*best_shade);
        }
    }

    spdlog::debug("Color {}: {} (closest={:.1f}, tolerance={:.1f}, coverage={:.3f})",
                  to_hex(color), match.present ? "present" : "absent",
                  match.closest_distance, config_.color_tolerance, match.coverage);
    return match;
}

ColorCheckResult ColorComplianceValidator::validate(const cv::Mat& image, const BrandSpec& brand) const {
    ColorCheckResult result;
    result.palette = extractor_.extract(image);

    result.primary = match_color(brand.primary_color, result.palette);
    result.secondary = match_color(brand.secondary_color, result.palette);

    // Partial brand color presence is a failure
    result.pass = result.primary.present && result.secondary.present;

    result.matched.insert(result.primary.matched_shades.begin(), result.primary.matched_shades.end());
    result.matched.insert(result.secondary.matched_shades.begin(), result.secondary.matched_shades.end());

    return result;
}

}  // namespace ccg
