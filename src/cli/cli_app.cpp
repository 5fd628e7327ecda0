/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @license MIT
 *
 * @details
 * Command-line interface for Creative Compliance Gate.
 * Runs a campaign brief through legal screening and per-creative brand
 * compliance, then writes the JSON report.
 */

#include "cli/cli_app.hpp"
#include "core/compliance_gate.hpp"
#include "pipeline/campaign_pipeline.hpp"
#include "pipeline/file_collaborators.hpp"
#include "report/campaign_report.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <cstdint>
#include <filesystem>
#include <string>

#ifdef _WIN32
    #include <windows.h>
#endif

namespace fs = std::filesystem;

namespace ccg::cli {

namespace {

// =============================================================================
// Platform-specific console setup
// =============================================================================

void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "Creative Compliance Gate");
    fmt::print(fmt::fg(fmt::color::gray), "  v{}\n\n", kVersion);
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

int run(int argc, char** argv) {
    setup_console();

    CLI::App app{"Creative Compliance Gate - brand and legal checks for campaign creatives"};
    app.set_version_flag("-V,--version", kVersion);

    // Inputs
    std::string brief_path;
    std::string terms_path;
    std::string config_path;

    app.add_option("-b,--brief", brief_path, "Campaign brief (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-t,--terms", terms_path, "Prohibited term table (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-c,--config", config_path, "Gate configuration (JSON)")
        ->check(CLI::ExistingFile);

    // Outputs
    std::string report_path;
    std::string output_dir;

    app.add_option("-r,--report", report_path, "Write the campaign report to this file");
    app.add_option("-o,--output-dir", output_dir, "Copy evaluated creatives into this directory");

    // Policy overrides
    double logo_threshold = 0.0;
    double color_tolerance = 0.0;
    std::uint64_t seed = 0;
    bool whole_word = false;

    auto* logo_threshold_opt = app.add_option("--logo-threshold", logo_threshold,
                                              "Minimum logo match confidence [0..1]")
        ->check(CLI::Range(0.0, 1.0));
    auto* color_tolerance_opt = app.add_option("--color-tolerance", color_tolerance,
                                               "Max RGB distance for a brand color match")
        ->check(CLI::NonNegativeNumber);
    auto* seed_opt = app.add_option("--seed", seed, "Palette clustering seed");
    app.add_flag("--whole-word", whole_word, "Match prohibited terms as whole words only");

    // Verbosity
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Configure logging
    auto logger = spdlog::stdout_color_mt("ccg");
    spdlog::set_default_logger(logger);

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (!quiet) {
        print_banner();
    }

    try {
        GateConfig config = config_path.empty()
            ? GateConfig{}
            : GateConfig::load(path_from_utf8(config_path));
        if (logo_threshold_opt->count() > 0) config.logo.threshold = logo_threshold;
        if (color_tolerance_opt->count() > 0) config.color.color_tolerance = color_tolerance;
        if (seed_opt->count() > 0) config.palette.seed = seed;
        if (whole_word) config.legal.match_mode = MatchMode::WholeWord;

        // Term table is loaded once and shared read-only for the run
        const TermTable terms = TermTable::load(path_from_utf8(terms_path));
        const CampaignBrief brief = CampaignBrief::load(path_from_utf8(brief_path));
        const ComplianceGate gate(config);

        StaticTranslator translator(brief.translated_message);
        FileCreativeGenerator generator;
        DirectoryUploader uploader(output_dir.empty() ? fs::path{} : path_from_utf8(output_dir));

        PipelineOptions options;
        options.upload_enabled = !output_dir.empty();

        CampaignPipeline pipeline(gate, terms, translator, generator, uploader, options);
        const CampaignResult result = pipeline.run(brief);

        if (!report_path.empty()) {
            report::write_report(result, path_from_utf8(report_path));
        }
        if (!quiet) {
            report::print_summary(result);
        }

        if (result.blocked) {
            return kExitBlocked;
        }
        const bool all_ok = result.failed_count() == 0 && result.non_compliant_count() == 0;
        return all_ok ? kExitOk : kExitFailure;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitFailure;
    }
}

}  // namespace ccg::cli
