/**
 * @file    compliance_gate.cpp
 * @brief   Per-creative and per-message compliance verdicts
 * @license MIT
 */

#include "core/compliance_gate.hpp"
#include "core/color_utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <chrono>

namespace ccg {

ComplianceGate::ComplianceGate(GateConfig config)
    : config_(std::move(config))
    , logo_detector_(config_.logo)
    , color_validator_(config_.color, config_.palette)
    , legal_screener_(config_.legal) {
    config_.validate();
}

ComplianceVerdict ComplianceGate::evaluate_creative(const cv::Mat& image, const BrandSpec& brand) const {
    auto start_time = std::chrono::high_resolution_clock::now();

    ComplianceVerdict verdict{};

    verdict.logo = logo_detector_.detect(image, brand.logo);

    ColorCheckResult colors = color_validator_.validate(image, brand);
    verdict.color_pass = colors.pass;
    verdict.matched_colors = std::move(colors.matched);
    verdict.primary = std::move(colors.primary);
    verdict.secondary = std::move(colors.secondary);
    verdict.palette = std::move(colors.palette);

    verdict.overall_pass = verdict.logo.found && verdict.color_pass;

    if (!verdict.logo.found) {
        verdict.violations.push_back(
            fmt::format("Logo not detected (confidence: {:.2f})", verdict.logo.confidence));
    }
    if (!verdict.primary.present) {
        verdict.violations.push_back(fmt::format(
            "Primary color {} not present (closest: {:.1f} > tolerance {:.1f})",
            to_hex(verdict.primary.color), verdict.primary.closest_distance,
            config_.color.color_tolerance));
    }
    if (!verdict.secondary.present) {
        verdict.violations.push_back(fmt::format(
            "Secondary color {} not present (closest: {:.1f} > tolerance {:.1f})",
            to_hex(verdict.secondary.color), verdict.secondary.closest_distance,
            config_.color.color_tolerance));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    spdlog::info("Creative {}x{}: logo={:.2f} ({}) colors={} -> {} in {} us",
                 image.cols, image.rows,
                 verdict.logo.confidence, verdict.logo.found ? "found" : "missing",
                 verdict.color_pass ? "pass" : "fail",
                 verdict.overall_pass ? "COMPLIANT" : "NON-COMPLIANT",
                 elapsed);

    return verdict;
}

LegalVerdict ComplianceGate::evaluate_message(
    std::string_view original,
    std::string_view translated,
    const TermTable& terms) const
{
    LegalVerdict verdict = legal_screener_.screen(original, terms, TextSource::Original);

    // An untranslated message is one message; screen it once
    if (translated != original) {
        verdict = verdict.merged_with(
            legal_screener_.screen(translated, terms, TextSource::Translated));
    }

    const auto highest = verdict.highest_severity();
    spdlog::info("Message screening: {} (highest severity: {}){}",
                 verdict.details(),
                 highest ? to_string(*highest) : "NONE",
                 verdict.blocked ? " -> BLOCKED" : "");

    return verdict;
}

}  // namespace ccg
