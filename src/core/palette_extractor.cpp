/**
 * @file    palette_extractor.cpp
 * @brief   Dominant color extraction via seeded k-means
 * @license MIT
 */

#include "core/palette_extractor.hpp"
#include "core/color_utils.hpp"

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <stdexcept>

namespace ccg {

namespace {

std::uint8_t round_channel(float v) {
    return static_cast<std::uint8_t>(std::clamp(static_cast<int>(std::lround(v)), 0, 255));
}

// Descending weight, ties broken by color so the order is total
void sort_palette(Palette& palette) {
    std::sort(palette.begin(), palette.end(),
              [](const PaletteEntry& a, const PaletteEntry& b) {
                  if (a.weight != b.weight) return a.weight > b.weight;
                  return a.color < b.color;
              });
}

// Count distinct colors; gives up (returns empty) as soon as more than `limit` are seen
std::map<ColorSample, int> count_distinct(const std::vector<ColorSample>& samples, int limit) {
    std::map<ColorSample, int> counts;
    for (const auto& s : samples) {
        ++counts[s];
        if (static_cast<int>(counts.size()) > limit) {
            return {};
        }
    }
    return counts;
}

}  // anonymous namespace

PaletteExtractor::PaletteExtractor(PaletteConfig config)
    : config_(std::move(config)) {}

Palette PaletteExtractor::extract(const cv::Mat& image) const {
    return extract(image, config_.k);
}

Palette PaletteExtractor::extract(const cv::Mat& image, int k) const {
    if (k < 1) {
        throw std::invalid_argument(fmt::format("Cluster count must be positive, got {}", k));
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    const std::vector<ColorSample> samples = sample_pixels(image, config_.max_samples);
    const double total = static_cast<double>(samples.size());

    Palette palette;

    // =========================================================================
    // Few distinct colors: exact palette, no clustering needed
    // =========================================================================
    auto distinct = count_distinct(samples, k);
    if (!distinct.empty()) {
        palette.reserve(distinct.size());
        for (const auto& [color, count] : distinct) {
            palette.push_back(PaletteEntry{color, count / total});
        }
        sort_palette(palette);

        spdlog::debug("Palette: {} distinct colors <= k={}, clustering skipped",
                      palette.size(), k);
        return palette;
    }

    // =========================================================================
    // K-means over RGB samples
    // =========================================================================
    cv::Mat data(static_cast<int>(samples.size()), 3, CV_32F);
    for (int i = 0; i < data.rows; ++i) {
        float* row = data.ptr<float>(i);
        row[0] = samples[i].r;
        row[1] = samples[i].g;
        row[2] = samples[i].b;
    }

    cv::Mat labels;
    cv::Mat centers;
    const cv::TermCriteria criteria(
        cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER,
        config_.max_iterations,
        config_.epsilon);

    // cv::kmeans draws from the calling thread's RNG; reseed it so the
    // k-means++ initialization is reproducible
    double compactness = 0.0;
    {
        const ScopedRngSeed seeded(config_.seed);
        compactness = cv::kmeans(
            data, k, labels, criteria, config_.attempts, cv::KMEANS_PP_CENTERS, centers);
    }

    std::vector<int> counts(static_cast<size_t>(k), 0);
    for (int i = 0; i < labels.rows; ++i) {
        ++counts[static_cast<size_t>(labels.at<int>(i))];
    }

    palette.reserve(static_cast<size_t>(k));
    for (int c = 0; c < k; ++c) {
        if (counts[static_cast<size_t>(c)] == 0) continue;  // Empty cluster
        const float* center = centers.ptr<float>(c);
        palette.push_back(PaletteEntry{
            ColorSample{round_channel(center[0]), round_channel(center[1]), round_channel(center[2])},
            counts[static_cast<size_t>(c)] / total
        });
    }
    sort_palette(palette);

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    spdlog::debug("Palette: k={} over {} samples in {} us (compactness={:.1f})",
                  k, samples.size(), elapsed, compactness);
    for (const auto& entry : palette) {
        spdlog::debug("  {} weight={:.4f}", to_hex(entry.color), entry.weight);
    }

    return palette;
}

}  // namespace ccg
