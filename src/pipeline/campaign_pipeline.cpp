/**
 * @file    campaign_pipeline.cpp
 * @brief   Campaign orchestration around the compliance gate
 * @license MIT
 */

#include "pipeline/campaign_pipeline.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>

namespace ccg {

namespace {

double seconds_since(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double>(
        std::chrono::high_resolution_clock::now() - start).count();
}

}  // anonymous namespace

int CampaignResult::compliant_count() const noexcept {
    return static_cast<int>(std::count_if(products.begin(), products.end(),
        [](const ProductResult& p) { return p.compliant(); }));
}

int CampaignResult::non_compliant_count() const noexcept {
    return static_cast<int>(std::count_if(products.begin(), products.end(),
        [](const ProductResult& p) { return !p.failed() && !p.compliant(); }));
}

int CampaignResult::failed_count() const noexcept {
    return static_cast<int>(std::count_if(products.begin(), products.end(),
        [](const ProductResult& p) { return p.failed(); }));
}

CampaignPipeline::CampaignPipeline(
    const ComplianceGate& gate,
    const TermTable& terms,
    MessageTranslator& translator,
    CreativeGenerator& generator,
    AssetUploader& uploader,
    PipelineOptions options)
    : gate_(gate)
    , terms_(terms)
    , translator_(translator)
    , generator_(generator)
    , uploader_(uploader)
    , options_(options) {}

CampaignResult CampaignPipeline::run(const CampaignBrief& brief) {
    auto start_time = std::chrono::high_resolution_clock::now();

    CampaignResult result;
    result.campaign_id = brief.campaign_id;

    // =========================================================================
    // Fail fast: screen the original message before paying for translation
    // =========================================================================
    result.legal = gate_.evaluate_message(brief.campaign_message, brief.campaign_message, terms_);
    if (result.legal.blocked) {
        result.blocked = true;
        result.elapsed_seconds = seconds_since(start_time);
        spdlog::error("[FAIL] Campaign {} blocked: {}", brief.campaign_id, result.legal.details());
        return result;
    }

    result.translated_message = translator_.translate(
        brief.campaign_message, brief.region, brief.target_audience);

    result.legal = gate_.evaluate_message(brief.campaign_message, result.translated_message, terms_);
    if (result.legal.blocked) {
        result.blocked = true;
        result.elapsed_seconds = seconds_since(start_time);
        spdlog::error("[FAIL] Campaign {} blocked after translation: {}",
                      brief.campaign_id, result.legal.details());
        return result;
    }

    if (!result.legal.findings.empty()) {
        spdlog::warn("[WARN] Legal warnings: {} issue(s)", result.legal.findings.size());
    }

    // =========================================================================
    // Per-product creatives; one failure never stops its siblings
    // =========================================================================
    for (const auto& product : brief.products) {
        spdlog::info("Processing: {}", product.name);
        result.products.push_back(
            process_product(brief, product, result.translated_message, result.legal));
    }

    result.elapsed_seconds = seconds_since(start_time);
    spdlog::info("Campaign {} done in {:.2f}s: {} compliant, {} non-compliant, {} failed",
                 brief.campaign_id, result.elapsed_seconds,
                 result.compliant_count(), result.non_compliant_count(), result.failed_count());
    return result;
}

ProductResult CampaignPipeline::process_product(
    const CampaignBrief& brief,
    const Product& product,
    const std::string& message,
    const LegalVerdict& legal)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    ProductResult result;
    result.product_name = product.name;
    result.legal_flags = legal.findings;

    try {
        cv::Mat creative = generator_.generate(brief, product, message);
        result.generated = true;

        result.compliance = gate_.evaluate_creative(creative, brief.brand);
        if (!result.compliance->overall_pass) {
            std::string reasons;
            for (const auto& v : result.compliance->violations) {
                if (!reasons.empty()) reasons += ", ";
                reasons += v;
            }
            spdlog::warn("COMPLIANCE FAILED | Product: {} | Violations: {}", product.name, reasons);
        }

        // Non-compliant creatives are still delivered; the report flags them
        if (options_.upload_enabled) {
            uploader_.upload(brief.campaign_id, product, creative);
            result.uploaded = true;
        }
    } catch (const std::exception& e) {
        result.error = e.what();
        spdlog::error("Error processing product {}: {}", product.name, e.what());
    }

    result.elapsed_seconds = seconds_since(start_time);
    return result;
}

}  // namespace ccg
