/**
 * @file    campaign_brief.hpp
 * @brief   Campaign brief model and JSON loading
 * @license MIT
 */

#pragma once

#include "core/brand_spec.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ccg {

struct Product {
    std::string name;
    std::string description;
    std::filesystem::path asset_path;    // Empty when the creative must be generated
};

struct CampaignBrief {
    std::string campaign_id;
    std::vector<Product> products;
    std::string region;
    std::string target_audience;
    std::string campaign_message;
    std::optional<std::string> translated_message;
    BrandSpec brand;

    static constexpr size_t kMaxMessageLength = 500;

    /**
     * Load and validate a brief. Relative asset and logo paths are
     * resolved against the brief's directory.
     *
     * @throws ConfigurationError on missing/empty fields, a message longer
     *         than kMaxMessageLength code points, or an invalid brand spec
     */
    static CampaignBrief load(const std::filesystem::path& path);
};

}  // namespace ccg
