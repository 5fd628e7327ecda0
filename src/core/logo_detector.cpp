/**
 * @file    logo_detector.cpp
 * @brief   Multi-scale logo detection by normalized cross-correlation
 * @license MIT
 */

#include "core/logo_detector.hpp"
#include "core/color_utils.hpp"
#include "core/types.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <vector>

namespace ccg {

namespace {

// Scores closer than this are treated as ties
constexpr double kScoreEpsilon = 1e-6;

// Templates with less spread than this cannot be correlated meaningfully
constexpr double kFlatTemplateStdDev = 1e-4;

// Creative windows with less variance than this score as no match
constexpr double kFlatWindowVariance = 1e-6;

/**
 * Zero the scores of windows where the creative is (nearly) constant, and
 * any score the correlation left non-finite.
 * NCC is undefined there and OpenCV may report anything up to +/-1.
 */
void suppress_flat_windows(const cv::Mat& sum, const cv::Mat& sqsum, cv::Size window, cv::Mat& scores) {
    const double n = static_cast<double>(window.area());
    for (int y = 0; y < scores.rows; ++y) {
        float* row = scores.ptr<float>(y);
        const int y1 = y + window.height;
        for (int x = 0; x < scores.cols; ++x) {
            const int x1 = x + window.width;
            const double s = sum.at<double>(y1, x1) - sum.at<double>(y, x1)
                           - sum.at<double>(y1, x) + sum.at<double>(y, x);
            const double s2 = sqsum.at<double>(y1, x1) - sqsum.at<double>(y, x1)
                            - sqsum.at<double>(y1, x) + sqsum.at<double>(y, x);
            if (!std::isfinite(row[x]) || (s2 - s * s / n) / n < kFlatWindowVariance) {
                row[x] = 0.0f;
            }
        }
    }
}

/**
 * Masked variant: the variance is taken over the pixels under `mask` only.
 * Window sums come from correlating the creative (and its square) with the mask.
 */
void suppress_flat_masked_windows(const cv::Mat& image, const cv::Mat& image_sq,
                                  const cv::Mat& mask, cv::Mat& scores) {
    cv::Mat weights;
    mask.convertTo(weights, CV_32F, 1.0 / 255.0);
    const double n = cv::countNonZero(mask);

    cv::Mat sum, sqsum;
    cv::matchTemplate(image, weights, sum, cv::TM_CCORR);
    cv::matchTemplate(image_sq, weights, sqsum, cv::TM_CCORR);

    for (int y = 0; y < scores.rows; ++y) {
        float* row = scores.ptr<float>(y);
        const float* s = sum.ptr<float>(y);
        const float* s2 = sqsum.ptr<float>(y);
        for (int x = 0; x < scores.cols; ++x) {
            const double mean = s[x] / n;
            if (!std::isfinite(row[x]) || s2[x] / n - mean * mean < kFlatWindowVariance) {
                row[x] = 0.0f;
            }
        }
    }
}

/**
 * Logo reference reduced to its opaque bounding box.
 * `mask` is empty when every pixel in the box is fully opaque.
 */
struct LogoTemplate {
    cv::Mat image;
    cv::Mat mask;    // CV_8U, 255 where opaque
};

/**
 * Crop a BGRA logo to the bounding box of its opaque pixels, keeping the
 * alpha as a binary mask so hidden color under transparency is ignored
 */
LogoTemplate crop_to_opaque(const cv::Mat& logo) {
    if (logo.channels() != 4) {
        return LogoTemplate{logo, cv::Mat()};
    }

    cv::Mat alpha;
    cv::extractChannel(logo, alpha, 3);
    if (alpha.depth() != CV_8U) {
        const double alpha_scale = alpha.depth() == CV_16U ? 1.0 / 257.0
                                 : alpha.depth() == CV_32F || alpha.depth() == CV_64F ? 255.0 : 1.0;
        alpha.convertTo(alpha, CV_8U, alpha_scale);
    }

    std::vector<cv::Point> opaque;
    cv::findNonZero(alpha, opaque);
    if (opaque.empty()) {
        throw InvalidImageError("Logo reference has no opaque pixels");
    }

    const cv::Rect bbox = cv::boundingRect(opaque);
    LogoTemplate result{logo(bbox), cv::Mat()};

    cv::Mat mask;
    cv::threshold(alpha(bbox), mask, 127, 255, cv::THRESH_BINARY);
    if (cv::countNonZero(mask) < bbox.area()) {
        result.mask = mask;
    }
    return result;
}

/**
 * Scale factors ordered by distance from 1.0, so ties resolve toward the
 * logo's native size, then capped
 */
std::vector<double> ordered_scales(const LogoConfig& config) {
    std::vector<double> scales = config.scales;
    std::sort(scales.begin(), scales.end(), [](double a, double b) {
        const double da = std::abs(a - 1.0);
        const double db = std::abs(b - 1.0);
        if (da != db) return da < db;
        return a < b;
    });
    scales.erase(std::unique(scales.begin(), scales.end()), scales.end());

    if (static_cast<int>(scales.size()) > config.max_scales) {
        scales.resize(static_cast<size_t>(config.max_scales));
    }
    return scales;
}

}  // anonymous namespace

LogoDetector::LogoDetector(LogoConfig config)
    : config_(std::move(config)) {}

LogoMatch LogoDetector::detect(const cv::Mat& image, const cv::Mat& logo) const {
    return detect(image, logo, config_.threshold);
}

LogoMatch LogoDetector::detect(const cv::Mat& image, const cv::Mat& logo, double threshold) const {
    if (image.empty()) {
        throw InvalidImageError("Logo detection: empty creative");
    }
    if (logo.empty()) {
        throw InvalidImageError("Logo detection: empty logo reference");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    LogoMatch result{};

    const LogoTemplate logo_tmpl = crop_to_opaque(logo);
    const cv::Mat logo_gray = to_gray_f32(logo_tmpl.image);
    const bool masked = !logo_tmpl.mask.empty();
    cv::Mat image_gray = to_gray_f32(image);

    // =========================================================================
    // Bound the search area: downscale large creatives
    // =========================================================================
    const int longest = std::max(image_gray.cols, image_gray.rows);
    double search_factor = 1.0;
    if (longest > config_.max_search_dimension) {
        search_factor = static_cast<double>(config_.max_search_dimension) / longest;
        cv::resize(image_gray, image_gray, cv::Size(), search_factor, search_factor, cv::INTER_AREA);
        spdlog::debug("Logo detection: creative downscaled by {:.3f} to {}x{}",
                      search_factor, image_gray.cols, image_gray.rows);
    }

    cv::Mat window_sum, window_sqsum, image_sq;
    if (masked) {
        cv::multiply(image_gray, image_gray, image_sq);
    } else {
        cv::integral(image_gray, window_sum, window_sqsum, CV_64F, CV_64F);
    }

    // =========================================================================
    // Multi-scale NCC
    // =========================================================================
    struct Candidate {
        cv::Point position;    // Position within the searched (downscaled) creative
        cv::Size size;         // Template size at this scale
        double scale;
        double score;
    };

    Candidate best{cv::Point(0, 0), cv::Size(0, 0), 0.0, -1.0};

    for (double scale : ordered_scales(config_)) {
        const double f = scale * search_factor;
        const int tw = static_cast<int>(std::lround(logo_gray.cols * f));
        const int th = static_cast<int>(std::lround(logo_gray.rows * f));

        if (tw < config_.min_template_size || th < config_.min_template_size) {
            spdlog::debug("  scale {:.2f}: template {}x{} below minimum, skipped", scale, tw, th);
            continue;
        }

        // Template must fit within the creative
        if (tw > image_gray.cols || th > image_gray.rows) {
            spdlog::debug("  scale {:.2f}: template {}x{} larger than creative, skipped", scale, tw, th);
            continue;
        }

        cv::Mat tmpl;
        cv::resize(logo_gray, tmpl, cv::Size(tw, th), 0, 0,
                   f > 1.0 ? cv::INTER_LINEAR : cv::INTER_AREA);

        cv::Mat tmpl_mask;
        if (masked) {
            cv::resize(logo_tmpl.mask, tmpl_mask, cv::Size(tw, th), 0, 0, cv::INTER_NEAREST);
            if (cv::countNonZero(tmpl_mask) == 0) {
                spdlog::debug("  scale {:.2f}: no opaque pixels left, skipped", scale);
                continue;
            }
        }

        cv::Scalar mean, stddev;
        cv::meanStdDev(tmpl, mean, stddev, tmpl_mask);
        if (stddev[0] < kFlatTemplateStdDev) {
            spdlog::debug("  scale {:.2f}: flat template, skipped", scale);
            continue;
        }

        cv::Mat match_result;
        if (masked) {
            cv::matchTemplate(image_gray, tmpl, match_result, cv::TM_CCOEFF_NORMED, tmpl_mask);
            cv::patchNaNs(match_result, 0.0);
            suppress_flat_masked_windows(image_gray, image_sq, tmpl_mask, match_result);
        } else {
            cv::matchTemplate(image_gray, tmpl, match_result, cv::TM_CCOEFF_NORMED);
            cv::patchNaNs(match_result, 0.0);
            suppress_flat_windows(window_sum, window_sqsum, tmpl.size(), match_result);
        }

        double min_val, max_val;
        cv::Point min_loc, max_loc;
        cv::minMaxLoc(match_result, &min_val, &max_val, &min_loc, &max_loc);

        result.scales_searched++;

        spdlog::debug("  scale {:.2f}: ncc={:.3f} at ({},{})", scale, max_val, max_loc.x, max_loc.y);

        if (max_val > best.score + kScoreEpsilon) {
            best = Candidate{max_loc, cv::Size(tw, th), scale, max_val};
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    if (result.scales_searched == 0) {
        spdlog::info("Logo detection: logo does not fit creative at any scale ({} us)", elapsed);
        return result;
    }

    result.confidence = static_cast<float>(std::clamp(best.score, 0.0, 1.0));
    result.scale = best.scale;
    result.found = result.confidence >= threshold;

    if (result.found) {
        // Convert from searched coordinates back to creative coordinates
        const double inv = 1.0 / search_factor;
        result.location = cv::Rect(
            static_cast<int>(std::lround(best.position.x * inv)),
            static_cast<int>(std::lround(best.position.y * inv)),
            static_cast<int>(std::lround(best.size.width * inv)),
            static_cast<int>(std::lround(best.size.height * inv))
        ) & cv::Rect(0, 0, image.cols, image.rows);
    }

    spdlog::info("Logo detection: confidence={:.3f} scale={:.2f} threshold={:.2f} -> {} in {} us ({} scales)",
                 result.confidence, result.scale, threshold,
                 result.found ? "FOUND" : "not found",
                 elapsed, result.scales_searched);

    return result;
}

}  // namespace ccg
