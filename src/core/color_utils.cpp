/**
 * @file    color_utils.cpp
 * @brief   Image sampling and color distance primitives
 * @license MIT
 */

#include "core/color_utils.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace ccg {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::uint8_t clamp_channel(int value) {
    return static_cast<std::uint8_t>(std::clamp(value, 0, 255));
}

// Bring 16-bit / float rasters down to 8-bit, keep channel count
cv::Mat to_depth8(const cv::Mat& image) {
    switch (image.depth()) {
        case CV_8U:
            return image;
        case CV_16U: {
            cv::Mat out;
            image.convertTo(out, CV_8U, 1.0 / 257.0);
            return out;
        }
        case CV_32F: {
            cv::Mat out;
            image.convertTo(out, CV_8U, 255.0);
            return out;
        }
        default:
            throw InvalidImageError(fmt::format("Unsupported image depth: {}", image.depth()));
    }
}

}  // anonymous namespace

ColorSample parse_hex_color(std::string_view hex) {
    std::string_view digits = hex;
    if (!digits.empty() && digits.front() == '#') {
        digits.remove_prefix(1);
    }
    if (digits.size() != 6) {
        throw ConfigurationError(fmt::format("Invalid hex color '{}': expected #RRGGBB", hex));
    }

    int channels[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hex_digit(digits[i * 2]);
        const int lo = hex_digit(digits[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw ConfigurationError(fmt::format("Invalid hex color '{}': non-hex digit", hex));
        }
        channels[i] = hi * 16 + lo;
    }

    return ColorSample{
        static_cast<std::uint8_t>(channels[0]),
        static_cast<std::uint8_t>(channels[1]),
        static_cast<std::uint8_t>(channels[2])
    };
}

std::string to_hex(const ColorSample& color) {
    return fmt::format("#{:02X}{:02X}{:02X}", color.r, color.g, color.b);
}

ShadeSet make_shade_set(const ColorSample& color, int steps, int step) {
    ShadeSet shades;
    shades.reserve(static_cast<size_t>(2 * steps + 1));

    for (int i = -steps; i <= steps; ++i) {
        const int offset = i * step;
        shades.push_back(ColorSample{
            clamp_channel(color.r + offset),
            clamp_channel(color.g + offset),
            clamp_channel(color.b + offset)
        });
    }
    return shades;
}

cv::Mat decode_image(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) {
        throw InvalidImageError("Cannot decode image: no data");
    }

    cv::Mat image;
    try {
        image = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw InvalidImageError(fmt::format("Cannot decode image: {}", e.what()));
    }
    if (image.empty()) {
        throw InvalidImageError(fmt::format("Cannot decode image ({} bytes)", bytes.size()));
    }
    return image;
}

cv::Mat load_image(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw InvalidImageError(fmt::format("Cannot open image: {}", path));
    }

    std::vector<std::uint8_t> bytes(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );

    try {
        cv::Mat image = decode_image(bytes);
        spdlog::debug("Loaded {} ({}x{}, {} channels)",
                      path.filename(), image.cols, image.rows, image.channels());
        return image;
    } catch (const InvalidImageError& e) {
        throw InvalidImageError(fmt::format("{}: {}", path, e.what()));
    }
}

cv::Mat to_bgr8(const cv::Mat& image) {
    if (image.empty()) {
        throw InvalidImageError("Empty image provided");
    }

    cv::Mat image8 = to_depth8(image);
    cv::Mat bgr;

    // Ensure BGR format
    switch (image8.channels()) {
        case 1:
            cv::cvtColor(image8, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            bgr = image8;
            break;
        case 4:
            cv::cvtColor(image8, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw InvalidImageError(fmt::format("Unsupported channel count: {}", image8.channels()));
    }
    return bgr;
}

cv::Mat to_gray_f32(const cv::Mat& image) {
    cv::Mat bgr = to_bgr8(image);
    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

    cv::Mat gray_f;
    gray.convertTo(gray_f, CV_32F, 1.0 / 255.0);
    return gray_f;
}

std::vector<ColorSample> sample_pixels(const cv::Mat& image, int max_samples) {
    if (image.empty()) {
        throw InvalidImageError("Empty image provided");
    }

    cv::Mat image8 = to_depth8(image);
    const int channels = image8.channels();
    if (channels != 1 && channels != 3 && channels != 4) {
        throw InvalidImageError(fmt::format("Unsupported channel count: {}", channels));
    }

    // Grid stride so that roughly max_samples pixels are visited
    const double total = static_cast<double>(image8.rows) * image8.cols;
    const int stride = std::max(1, static_cast<int>(
        std::ceil(std::sqrt(total / std::max(1, max_samples)))));

    std::vector<ColorSample> samples;
    samples.reserve(static_cast<size_t>(
        ((image8.rows + stride - 1) / stride) * ((image8.cols + stride - 1) / stride)));

    for (int y = 0; y < image8.rows; y += stride) {
        const std::uint8_t* row = image8.ptr<std::uint8_t>(y);
        for (int x = 0; x < image8.cols; x += stride) {
            const std::uint8_t* px = row + static_cast<ptrdiff_t>(x) * channels;
            if (channels == 1) {
                samples.push_back(ColorSample{px[0], px[0], px[0]});
            } else {
                if (channels == 4 && px[3] == 0) continue;
                samples.push_back(ColorSample{px[2], px[1], px[0]});
            }
        }
    }

    if (samples.empty()) {
        throw InvalidImageError("Image has no opaque pixels");
    }

    spdlog::debug("Sampled {} pixels from {}x{} image (stride {})",
                  samples.size(), image8.cols, image8.rows, stride);
    return samples;
}

}  // namespace ccg
