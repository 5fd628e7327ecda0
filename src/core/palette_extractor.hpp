/**
 * @file    palette_extractor.hpp
 * @brief   Dominant color extraction via seeded k-means
 * @license MIT
 *
 * @details
 * Reduces an image to its K dominant colors:
 * 1. Grid-sample opaque pixels (exact values, no interpolation)
 * 2. If the sample has <= K distinct colors, return them directly
 * 3. Otherwise run cv::kmeans (k-means++ init) with a fixed RNG seed
 *
 * Results are reproducible for identical input and configuration.
 */

#pragma once

#include "core/gate_config.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <vector>

namespace ccg {

/**
 * One dominant color and the fraction of sampled pixels assigned to it
 */
struct PaletteEntry {
    ColorSample color;
    double weight = 0.0;
};

using Palette = std::vector<PaletteEntry>;

/**
 * Reseeds the calling thread's cv::theRNG() for its lifetime and restores
 * the previous state on destruction, including when unwinding
 */
class ScopedRngSeed {
public:
    explicit ScopedRngSeed(std::uint64_t seed)
        : rng_(cv::theRNG()), saved_(rng_) {
        rng_ = cv::RNG(seed);
    }

    ~ScopedRngSeed() { rng_ = saved_; }

    ScopedRngSeed(const ScopedRngSeed&) = delete;
    ScopedRngSeed& operator=(const ScopedRngSeed&) = delete;

private:
    cv::RNG& rng_;
    cv::RNG saved_;
};

class PaletteExtractor {
public:
    explicit PaletteExtractor(PaletteConfig config = {});

    /**
     * Extract the dominant colors of an image
     *
     * @param image  BGR, BGRA or grayscale raster
     * @return       Entries sorted by descending weight; weights sum to 1.
     *               At most config.k entries, fewer if the image has fewer
     *               distinct colors.
     * @throws InvalidImageError if the image is empty or fully transparent
     */
    [[nodiscard]] Palette extract(const cv::Mat& image) const;

    /**
     * Same as extract() with an explicit cluster count
     */
    [[nodiscard]] Palette extract(const cv::Mat& image, int k) const;

    [[nodiscard]] const PaletteConfig& config() const noexcept { return config_; }

private:
    PaletteConfig config_;
};

}  // namespace ccg
