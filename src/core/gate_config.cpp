/**
 * @file    gate_config.cpp
 * @brief   Gate configuration loading
 * @license MIT
 */

#include "core/gate_config.hpp"
#include "core/types.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <fstream>

namespace ccg {

namespace {

using json = nlohmann::json;

// Read an optional key into `out`, leaving it untouched when absent
template <typename T>
void read_key(const json& section, const char* section_name, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(
            fmt::format("Invalid value for {}.{}: {}", section_name, key, e.what()));
    }
}

const json& section_or_empty(const json& root, const char* name) {
    static const json kEmpty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return kEmpty;
    if (!it->is_object()) {
        throw ConfigurationError(fmt::format("Config section '{}' must be an object", name));
    }
    return *it;
}

}  // anonymous namespace

GateConfig GateConfig::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError(fmt::format("Cannot open gate config: {}", path));
    }

    json root;
    try {
        root = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(fmt::format("Malformed gate config {}: {}", path, e.what()));
    }
    if (!root.is_object()) {
        throw ConfigurationError(fmt::format("Gate config {} must be a JSON object", path));
    }

    GateConfig config;

    const json& palette = section_or_empty(root, "palette");
    read_key(palette, "palette", "k", config.palette.k);
    read_key(palette, "palette", "seed", config.palette.seed);
    read_key(palette, "palette", "max_iterations", config.palette.max_iterations);
    read_key(palette, "palette", "epsilon", config.palette.epsilon);
    read_key(palette, "palette", "attempts", config.palette.attempts);
    read_key(palette, "palette", "max_samples", config.palette.max_samples);

    const json& color = section_or_empty(root, "color");
    read_key(color, "color", "shade_steps", config.color.shade_steps);
    read_key(color, "color", "shade_step", config.color.shade_step);
    read_key(color, "color", "color_tolerance", config.color.color_tolerance);
    read_key(color, "color", "min_cluster_weight", config.color.min_cluster_weight);

    const json& logo = section_or_empty(root, "logo");
    read_key(logo, "logo", "threshold", config.logo.threshold);
    read_key(logo, "logo", "scales", config.logo.scales);
    read_key(logo, "logo", "max_search_dimension", config.logo.max_search_dimension);
    read_key(logo, "logo", "min_template_size", config.logo.min_template_size);
    read_key(logo, "logo", "max_scales", config.logo.max_scales);

    const json& legal = section_or_empty(root, "legal");
    std::string mode = "substring";
    read_key(legal, "legal", "match_mode", mode);
    if (mode == "substring") {
        config.legal.match_mode = MatchMode::Substring;
    } else if (mode == "whole_word") {
        config.legal.match_mode = MatchMode::WholeWord;
    } else {
        throw ConfigurationError(fmt::format(
            "Invalid value for legal.match_mode: '{}' (expected substring or whole_word)", mode));
    }
    read_key(legal, "legal", "excerpt_radius", config.legal.excerpt_radius);

    config.validate();
    spdlog::debug("Loaded gate config from {}", path);
    return config;
}

void GateConfig::validate() const {
    auto require = [](bool ok, const char* key, const char* rule) {
        if (!ok) {
            throw ConfigurationError(fmt::format("Invalid value for {}: {}", key, rule));
        }
    };

    require(palette.k >= 1, "palette.k", "must be >= 1");
    require(palette.max_iterations >= 1, "palette.max_iterations", "must be >= 1");
    require(palette.epsilon >= 0.0, "palette.epsilon", "must be >= 0");
    require(palette.attempts >= 1, "palette.attempts", "must be >= 1");
    require(palette.max_samples >= 1, "palette.max_samples", "must be >= 1");

    require(color.shade_steps >= 0, "color.shade_steps", "must be >= 0");
    require(color.shade_step >= 0 && color.shade_step <= 255, "color.shade_step", "must be in [0, 255]");
    require(color.color_tolerance >= 0.0, "color.color_tolerance", "must be >= 0");
    require(color.min_cluster_weight >= 0.0 && color.min_cluster_weight < 1.0,
            "color.min_cluster_weight", "must be in [0, 1)");

    require(logo.threshold >= 0.0 && logo.threshold <= 1.0, "logo.threshold", "must be in [0, 1]");
    require(!logo.scales.empty(), "logo.scales", "must not be empty");
    for (double s : logo.scales) {
        require(s > 0.0, "logo.scales", "every scale must be > 0");
    }
    require(logo.max_search_dimension >= 16, "logo.max_search_dimension", "must be >= 16");
    require(logo.min_template_size >= 1, "logo.min_template_size", "must be >= 1");
    require(logo.max_scales >= 1, "logo.max_scales", "must be >= 1");

    require(legal.excerpt_radius >= 0, "legal.excerpt_radius", "must be >= 0");
}

}  // namespace ccg
