/**
 * @file    gate_config.hpp
 * @brief   Tunable policy constants for the compliance gate
 * @license MIT
 *
 * @details
 * Every threshold the gate applies lives here so that callers and tests
 * can vary it. Defaults reproduce the behavior of the original pipeline
 * (shade step 15, tolerance 40, logo threshold 0.7).
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace ccg {

/**
 * K-means palette extraction parameters
 */
struct PaletteConfig {
    int k = 5;                      // Number of clusters
    std::uint64_t seed = 0x5eed;    // RNG seed for centroid initialization
    int max_iterations = 100;       // K-means iteration cap
    double epsilon = 1.0;           // Centroid movement convergence threshold
    int attempts = 3;               // K-means restarts (best compactness wins)
    int max_samples = 20000;        // Pixel sample budget per image
};

/**
 * Brand color verification parameters
 */
struct ColorConfig {
    int shade_steps = 5;              // Shades on each side of the brand color
    int shade_step = 15;              // Per-channel offset between shades
    double color_tolerance = 40.0;    // Max RGB Euclidean distance to a centroid
    double min_cluster_weight = 0.001; // Clusters at or below this are noise
};

/**
 * Logo template matching parameters
 */
struct LogoConfig {
    double threshold = 0.7;
    std::vector<double> scales{0.5, 0.75, 1.0, 1.25, 1.5};
    int max_search_dimension = 1024;  // Longest side searched; larger images are downscaled
    int min_template_size = 8;        // Scaled templates below this are skipped
    int max_scales = 16;              // Hard cap on scale factors evaluated
};

enum class MatchMode {
    Substring,
    WholeWord,
};

/**
 * Legal screening parameters
 */
struct LegalConfig {
    MatchMode match_mode = MatchMode::Substring;
    int excerpt_radius = 20;          // Characters of context kept around a hit
};

struct GateConfig {
    PaletteConfig palette;
    ColorConfig color;
    LogoConfig logo;
    LegalConfig legal;

    /**
     * Load from a JSON file. Missing keys keep their defaults.
     *
     * @throws ConfigurationError if the file is unreadable, malformed,
     *         or a value has the wrong type or range
     */
    static GateConfig load(const std::filesystem::path& path);

    /**
     * Check value ranges
     * @throws ConfigurationError naming the offending key
     */
    void validate() const;
};

}  // namespace ccg
