/**
 * @file    file_collaborators.cpp
 * @brief   Local-filesystem stand-ins for translation, generation and upload
 * @license MIT
 */

#include "pipeline/file_collaborators.hpp"
#include "core/color_utils.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cctype>
#include <stdexcept>

namespace ccg {

// =============================================================================
// StaticTranslator
// =============================================================================

StaticTranslator::StaticTranslator(std::optional<std::string> translation)
    : translation_(std::move(translation)) {}

std::string StaticTranslator::translate(
    const std::string& message,
    const std::string& region,
    const std::string& /*target_audience*/)
{
    if (translation_) {
        spdlog::debug("Using provided translation for region {}", region);
        return *translation_;
    }
    spdlog::debug("No translation provided for region {}, using original message", region);
    return message;
}

// =============================================================================
// FileCreativeGenerator
// =============================================================================

cv::Mat FileCreativeGenerator::generate(
    const CampaignBrief& /*brief*/,
    const Product& product,
    const std::string& /*message*/)
{
    if (product.asset_path.empty()) {
        throw InvalidImageError(fmt::format("Product '{}' has no asset_path", product.name));
    }
    return load_image(product.asset_path);
}

// =============================================================================
// DirectoryUploader
// =============================================================================

DirectoryUploader::DirectoryUploader(std::filesystem::path root)
    : root_(std::move(root)) {}

std::string DirectoryUploader::slugify(const std::string& name) {
    std::string slug;
    slug.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            slug += static_cast<char>(std::tolower(c));
        } else if (!slug.empty() && slug.back() != '_') {
            slug += '_';
        }
    }
    while (!slug.empty() && slug.back() == '_') slug.pop_back();
    return slug.empty() ? "product" : slug;
}

void DirectoryUploader::upload(
    const std::string& campaign_id,
    const Product& product,
    const cv::Mat& creative)
{
    const std::filesystem::path dir = root_ / slugify(campaign_id);
    const std::filesystem::path out = dir / (slugify(product.name) + ".png");

    // Create output directory if needed
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("Cannot create {}: {}", dir, ec.message()));
    }

    const std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, 6};
    if (!cv::imwrite(out.string(), creative, params)) {
        throw std::runtime_error(fmt::format("Failed to write image: {}", out));
    }
    spdlog::info("Saved: {}", out);
}

}  // namespace ccg
