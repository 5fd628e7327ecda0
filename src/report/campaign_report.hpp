/**
 * @file    campaign_report.hpp
 * @brief   JSON report and console summary for a campaign run
 * @license MIT
 */

#pragma once

#include "core/compliance_gate.hpp"
#include "pipeline/campaign_pipeline.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>

namespace ccg::report {

nlohmann::json to_json(const LogoMatch& logo);
nlohmann::json to_json(const ComplianceVerdict& verdict);
nlohmann::json to_json(const LegalFinding& finding);
nlohmann::json to_json(const LegalVerdict& verdict);
nlohmann::json to_json(const ProductResult& product);
nlohmann::json to_json(const CampaignResult& result);

/**
 * Write the campaign report (pretty-printed JSON)
 *
 * @throws std::runtime_error if the file cannot be written
 */
void write_report(const CampaignResult& result, const std::filesystem::path& path);

/**
 * Colored console summary
 */
void print_summary(const CampaignResult& result);

}  // namespace ccg::report
