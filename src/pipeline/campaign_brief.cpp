/**
 * @file    campaign_brief.cpp
 * @brief   Campaign brief model and JSON loading
 * @license MIT
 */

#include "pipeline/campaign_brief.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <fstream>

namespace ccg {

namespace {

using json = nlohmann::json;

std::string required_text(const json& obj, const char* key, const char* what) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        throw ConfigurationError(fmt::format("{}: missing or non-string '{}'", what, key));
    }
    std::string value = it->get<std::string>();
    if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ConfigurationError(fmt::format("{}: '{}' must not be empty", what, key));
    }
    return value;
}

// Code points, not bytes: continuation bytes are 10xxxxxx
size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

}  // anonymous namespace

CampaignBrief CampaignBrief::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError(fmt::format("Cannot open campaign brief: {}", path));
    }

    json root;
    try {
        root = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(fmt::format("Malformed campaign brief {}: {}", path, e.what()));
    }
    if (!root.is_object()) {
        throw ConfigurationError("Campaign brief must be a JSON object");
    }

    CampaignBrief brief;
    brief.campaign_id = required_text(root, "campaign_id", "Campaign brief");
    brief.region = required_text(root, "region", "Campaign brief");
    brief.target_audience = required_text(root, "target_audience", "Campaign brief");
    brief.campaign_message = required_text(root, "campaign_message", "Campaign brief");

    if (const size_t length = utf8_length(brief.campaign_message); length > kMaxMessageLength) {
        throw ConfigurationError(fmt::format(
            "Campaign brief: campaign_message is {} characters (max {})",
            length, kMaxMessageLength));
    }

    if (auto it = root.find("translated_message"); it != root.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw ConfigurationError("Campaign brief: 'translated_message' must be a string");
        }
        brief.translated_message = it->get<std::string>();
    }

    auto products = root.find("products");
    if (products == root.end() || !products->is_array() || products->empty()) {
        throw ConfigurationError("Campaign brief: 'products' must be a non-empty array");
    }
    for (const auto& p : *products) {
        if (!p.is_object()) {
            throw ConfigurationError("Campaign brief: every product must be an object");
        }
        Product product;
        product.name = required_text(p, "name", "Product");
        product.description = required_text(p, "description", "Product");
        if (auto asset = p.find("asset_path"); asset != p.end() && !asset->is_null()) {
            if (!asset->is_string()) {
                throw ConfigurationError(fmt::format("Product '{}': 'asset_path' must be a string", product.name));
            }
            product.asset_path = resolve_relative_to(path, asset->get<std::string>());
        }
        brief.products.push_back(std::move(product));
    }

    auto brand = root.find("brand");
    if (brand == root.end()) {
        throw ConfigurationError("Campaign brief: missing 'brand'");
    }
    brief.brand = BrandSpec::from_json(*brand, path);

    spdlog::info("Campaign: {} | Products: {} | Region: {}",
                 brief.campaign_id, brief.products.size(), brief.region);
    return brief;
}

}  // namespace ccg
