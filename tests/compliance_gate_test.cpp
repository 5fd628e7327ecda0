#include "core/compliance_gate.hpp"
#include "test_images.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace ccg {
namespace {

BrandSpec test_brand() {
    return BrandSpec::create(test::make_logo(), test::kPrimaryHex, test::kSecondaryHex);
}

TEST(ComplianceGate, BrandedCreativePasses) {
    const ComplianceGate gate;
    const ComplianceVerdict verdict = gate.evaluate_creative(test::make_branded_creative(), test_brand());

    EXPECT_TRUE(verdict.logo.found);
    EXPECT_TRUE(verdict.color_pass);
    EXPECT_TRUE(verdict.overall_pass);
    EXPECT_EQ(verdict.matched_colors.count(test::kPrimary), 1u);
    EXPECT_EQ(verdict.matched_colors.count(test::kSecondary), 1u);
    EXPECT_TRUE(verdict.violations.empty());
}

TEST(ComplianceGate, MissingLogoFails) {
    cv::Mat creative = test::solid(400, 300, test::kPrimary);
    cv::rectangle(creative, cv::Rect(0, 200, 400, 100), test::bgr(test::kSecondary), cv::FILLED);

    const ComplianceVerdict verdict = ComplianceGate{}.evaluate_creative(creative, test_brand());

    EXPECT_FALSE(verdict.logo.found);
    EXPECT_TRUE(verdict.color_pass);
    EXPECT_FALSE(verdict.overall_pass);
    ASSERT_EQ(verdict.violations.size(), 1u);
    EXPECT_NE(verdict.violations[0].find("Logo not detected"), std::string::npos);
}

TEST(ComplianceGate, OffBrandColorsFail) {
    cv::Mat creative = test::solid(400, 300, ColorSample{0, 200, 0});
    test::composite(creative, test::make_logo(), cv::Point(100, 100));

    const ComplianceVerdict verdict = ComplianceGate{}.evaluate_creative(creative, test_brand());

    EXPECT_TRUE(verdict.logo.found);
    EXPECT_FALSE(verdict.color_pass);
    EXPECT_FALSE(verdict.overall_pass);
    EXPECT_TRUE(verdict.matched_colors.empty());
    ASSERT_EQ(verdict.violations.size(), 2u);
    EXPECT_NE(verdict.violations[0].find("#E65A1E"), std::string::npos);
    EXPECT_NE(verdict.violations[1].find("#143C78"), std::string::npos);
}

TEST(ComplianceGate, InvalidCreativeRaises) {
    EXPECT_THROW((void)ComplianceGate{}.evaluate_creative(cv::Mat(), test_brand()), InvalidImageError);
}

TEST(ComplianceGate, InvalidConfigIsRejectedAtConstruction) {
    GateConfig config;
    config.logo.threshold = 1.5;
    EXPECT_THROW(ComplianceGate{config}, ConfigurationError);

    GateConfig no_scales;
    no_scales.logo.scales.clear();
    EXPECT_THROW(ComplianceGate{no_scales}, ConfigurationError);

    GateConfig bad_k;
    bad_k.palette.k = 0;
    EXPECT_THROW(ComplianceGate{bad_k}, ConfigurationError);
}

TEST(ComplianceGate, ThresholdComesFromConfig) {
    GateConfig strict;
    strict.logo.threshold = 1.0;

    // A slightly blurred logo no longer matches perfectly
    cv::Mat creative = test::make_branded_creative(cv::Point(40, 40));
    cv::Mat region = creative(cv::Rect(40, 40, 60, 40));
    cv::GaussianBlur(region, region, cv::Size(5, 5), 1.5);

    const ComplianceVerdict lenient = ComplianceGate{}.evaluate_creative(creative, test_brand());
    const ComplianceVerdict exacting = ComplianceGate{strict}.evaluate_creative(creative, test_brand());

    EXPECT_TRUE(lenient.logo.found);
    EXPECT_FALSE(exacting.logo.found);
}

// -----------------------------------------------------------------------------
// Message screening
// -----------------------------------------------------------------------------

TEST(ComplianceGate, MessageVerdictMergesBothTexts) {
    TermTable terms;
    terms.add("best", Severity::Warning);
    terms.add("garantizado", Severity::Error);

    const LegalVerdict verdict = ComplianceGate{}.evaluate_message(
        "the best smile", "resultado garantizado", terms);

    EXPECT_TRUE(verdict.blocked);
    ASSERT_EQ(verdict.findings.size(), 2u);
    EXPECT_EQ(verdict.findings[0].term, "best");
    EXPECT_EQ(verdict.findings[0].source, TextSource::Original);
    EXPECT_EQ(verdict.findings[1].term, "garantizado");
    EXPECT_EQ(verdict.findings[1].source, TextSource::Translated);
}

TEST(ComplianceGate, TranslationKeepingTermInPlaceIsCountedTwice) {
    TermTable terms;
    terms.add("cure", Severity::Error);

    const LegalVerdict verdict = ComplianceGate{}.evaluate_message(
        "Cure your thirst", "Cure ta soif", terms);

    ASSERT_EQ(verdict.findings.size(), 2u);
    EXPECT_EQ(verdict.findings[0].source, TextSource::Original);
    EXPECT_EQ(verdict.findings[1].source, TextSource::Translated);
    EXPECT_TRUE(verdict.blocked);
}

TEST(ComplianceGate, IdenticalTranslationIsScreenedOnce) {
    TermTable terms;
    terms.add("best", Severity::Warning);

    const LegalVerdict verdict = ComplianceGate{}.evaluate_message("the best", "the best", terms);

    ASSERT_EQ(verdict.findings.size(), 1u);
    EXPECT_EQ(verdict.findings[0].source, TextSource::Original);
    EXPECT_FALSE(verdict.blocked);
}

TEST(ComplianceGate, MessageMatchModeFollowsConfig) {
    TermTable terms;
    terms.add("cure", Severity::Error);

    GateConfig whole_word;
    whole_word.legal.match_mode = MatchMode::WholeWord;

    EXPECT_TRUE(ComplianceGate{}.evaluate_message("secure", "secure", terms).blocked);
    EXPECT_FALSE(ComplianceGate{whole_word}.evaluate_message("secure", "secure", terms).blocked);
}

// -----------------------------------------------------------------------------
// Concurrency: the gate holds no mutable state
// -----------------------------------------------------------------------------

TEST(ComplianceGate, ConcurrentEvaluationsAgree) {
    const ComplianceGate gate;
    const BrandSpec brand = test_brand();
    const cv::Mat creative = test::make_branded_creative(cv::Point(150, 60));

    constexpr int kThreads = 4;
    std::vector<ComplianceVerdict> verdicts(kThreads);
    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i) {
        workers.emplace_back([&, i] {
            verdicts[i] = gate.evaluate_creative(creative, brand);
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    for (int i = 1; i < kThreads; ++i) {
        EXPECT_EQ(verdicts[i].overall_pass, verdicts[0].overall_pass);
        EXPECT_FLOAT_EQ(verdicts[i].logo.confidence, verdicts[0].logo.confidence);
        EXPECT_EQ(verdicts[i].logo.location, verdicts[0].logo.location);
        EXPECT_EQ(verdicts[i].matched_colors, verdicts[0].matched_colors);
    }
    EXPECT_TRUE(verdicts[0].overall_pass);
}

}  // namespace
}  // namespace ccg
