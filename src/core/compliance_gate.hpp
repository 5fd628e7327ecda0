/**
 * @file    compliance_gate.hpp
 * @brief   Per-creative and per-message compliance verdicts
 * @license MIT
 *
 * @details
 * Owns the verdict policy:
 * - A creative passes only if the logo is found AND both brand colors are
 *   present. Either check alone is not enough.
 * - A message is blocked if any finding in the original or the translated
 *   text has severity ERROR. Warnings never block.
 *
 * The gate holds no mutable state; one instance may be shared by worker
 * threads evaluating different creatives.
 */

#pragma once

#include "core/brand_spec.hpp"
#include "core/color_validator.hpp"
#include "core/gate_config.hpp"
#include "core/legal_screener.hpp"
#include "core/logo_detector.hpp"

#include <opencv2/core.hpp>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ccg {

/**
 * Combined outcome for one creative
 */
struct ComplianceVerdict {
    LogoMatch logo;
    bool color_pass = false;
    std::set<ColorSample> matched_colors;
    bool overall_pass = false;               // logo.found && color_pass

    // Audit detail
    BrandColorMatch primary;
    BrandColorMatch secondary;
    Palette palette;
    std::vector<std::string> violations;     // Human-readable reasons for failure
};

class ComplianceGate {
public:
    explicit ComplianceGate(GateConfig config = {});

    /**
     * Evaluate one generated creative against the brand
     *
     * @throws InvalidImageError if the creative or logo cannot be used;
     *         the caller treats the asset as failed, not the campaign
     */
    [[nodiscard]] ComplianceVerdict evaluate_creative(const cv::Mat& image, const BrandSpec& brand) const;

    /**
     * Screen the original and translated message independently and merge.
     * A translation identical to the original is screened only once.
     */
    [[nodiscard]] LegalVerdict evaluate_message(
        std::string_view original,
        std::string_view translated,
        const TermTable& terms
    ) const;

    [[nodiscard]] const GateConfig& config() const noexcept { return config_; }

private:
    GateConfig config_;
    LogoDetector logo_detector_;
    ColorComplianceValidator color_validator_;
    LegalScreener legal_screener_;
};

}  // namespace ccg
