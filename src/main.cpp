/**
 * @file    main.cpp
 * @brief   Creative Compliance Gate - CLI Entry Point
 * @license MIT
 *
 * @details
 * Gates AI-generated campaign creatives before delivery:
 *   - Legal screening of the campaign message (blocks on ERROR terms)
 *   - Logo presence via multi-scale template matching
 *   - Brand color presence via k-means palette + shade tolerance
 *
 * Usage:
 *   ccg --brief campaign.json --terms prohibited_words.json --report report.json
 *   ccg -b campaign.json -t terms.json -o delivered/ --logo-threshold 0.6 -v
 */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return ccg::cli::run(argc, argv);
}
