/**
 * @file    campaign_pipeline.hpp
 * @brief   Campaign orchestration around the compliance gate
 * @license MIT
 *
 * @details
 * Sequencing contract:
 *   1. Screen the original message; stop if blocked
 *   2. Translate, screen original + translated; stop if blocked
 *   3. Per product: generate -> evaluate -> upload
 *
 * A blocked message stops the campaign before any generation or upload.
 * A failing or erroring creative is recorded and its siblings proceed.
 *
 * Generation, translation and upload are external collaborators injected
 * through the interfaces below.
 */

#pragma once

#include "core/compliance_gate.hpp"
#include "pipeline/campaign_brief.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ccg {

// =============================================================================
// Collaborator interfaces
// =============================================================================

class MessageTranslator {
public:
    virtual ~MessageTranslator() = default;

    virtual std::string translate(
        const std::string& message,
        const std::string& region,
        const std::string& target_audience) = 0;
};

class CreativeGenerator {
public:
    virtual ~CreativeGenerator() = default;

    /**
     * Produce the final creative (asset + logo overlay + message) for a product
     */
    virtual cv::Mat generate(
        const CampaignBrief& brief,
        const Product& product,
        const std::string& message) = 0;
};

class AssetUploader {
public:
    virtual ~AssetUploader() = default;

    virtual void upload(
        const std::string& campaign_id,
        const Product& product,
        const cv::Mat& creative) = 0;
};

// =============================================================================
// Results
// =============================================================================

struct ProductResult {
    std::string product_name;
    bool generated = false;
    bool uploaded = false;
    std::optional<ComplianceVerdict> compliance;   // Absent if generation/evaluation failed
    std::vector<LegalFinding> legal_flags;         // Non-blocking findings for the message
    std::string error;                             // Set when the product failed
    double elapsed_seconds = 0.0;

    [[nodiscard]] bool failed() const noexcept { return !error.empty(); }
    [[nodiscard]] bool compliant() const noexcept {
        return !failed() && compliance.has_value() && compliance->overall_pass;
    }
};

struct CampaignResult {
    std::string campaign_id;
    bool blocked = false;
    LegalVerdict legal;
    std::string translated_message;
    std::vector<ProductResult> products;
    double elapsed_seconds = 0.0;

    [[nodiscard]] int compliant_count() const noexcept;
    [[nodiscard]] int non_compliant_count() const noexcept;
    [[nodiscard]] int failed_count() const noexcept;
};

// =============================================================================
// Pipeline
// =============================================================================

struct PipelineOptions {
    bool upload_enabled = true;
};

class CampaignPipeline {
public:
    CampaignPipeline(
        const ComplianceGate& gate,
        const TermTable& terms,
        MessageTranslator& translator,
        CreativeGenerator& generator,
        AssetUploader& uploader,
        PipelineOptions options = {}
    );

    /**
     * Run one campaign. Never throws for per-product failures; errors from
     * the translator propagate.
     */
    CampaignResult run(const CampaignBrief& brief);

private:
    ProductResult process_product(const CampaignBrief& brief, const Product& product,
                                  const std::string& message, const LegalVerdict& legal);

    const ComplianceGate& gate_;
    const TermTable& terms_;
    MessageTranslator& translator_;
    CreativeGenerator& generator_;
    AssetUploader& uploader_;
    PipelineOptions options_;
};

}  // namespace ccg
