/**
 * @file    file_collaborators.hpp
 * @brief   Local-filesystem stand-ins for translation, generation and upload
 * @license MIT
 *
 * @details
 * Used by the CLI to gate creatives that were already produced: the
 * "generator" reads each product's asset_path, the "uploader" writes the
 * accepted creative into an output directory.
 */

#pragma once

#include "pipeline/campaign_pipeline.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace ccg {

/**
 * Returns a fixed translation, or the message itself when none is given
 */
class StaticTranslator : public MessageTranslator {
public:
    explicit StaticTranslator(std::optional<std::string> translation = std::nullopt);

    std::string translate(
        const std::string& message,
        const std::string& region,
        const std::string& target_audience) override;

private:
    std::optional<std::string> translation_;
};

/**
 * Loads each product's creative from its asset_path
 */
class FileCreativeGenerator : public CreativeGenerator {
public:
    /**
     * @throws InvalidImageError if the product has no asset_path or it
     *         cannot be decoded
     */
    cv::Mat generate(
        const CampaignBrief& brief,
        const Product& product,
        const std::string& message) override;
};

/**
 * Writes creatives to <root>/<campaign_id>/<product>.png
 */
class DirectoryUploader : public AssetUploader {
public:
    explicit DirectoryUploader(std::filesystem::path root);

    /**
     * @throws std::runtime_error if the directory or file cannot be written
     */
    void upload(
        const std::string& campaign_id,
        const Product& product,
        const cv::Mat& creative) override;

    /**
     * Filesystem-safe file stem for a product name
     */
    static std::string slugify(const std::string& name);

private:
    std::filesystem::path root_;
};

}  // namespace ccg
