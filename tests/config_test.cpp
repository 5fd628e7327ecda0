#include "core/brand_spec.hpp"
#include "core/gate_config.hpp"
#include "pipeline/campaign_brief.hpp"
#include "test_images.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <fstream>
#include <string>

namespace ccg {
namespace {

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

// -----------------------------------------------------------------------------
// GateConfig
// -----------------------------------------------------------------------------

TEST(GateConfig, DefaultsAreValid) {
    const GateConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.palette.k, 5);
    EXPECT_EQ(config.color.shade_steps, 5);
    EXPECT_EQ(config.color.shade_step, 15);
    EXPECT_DOUBLE_EQ(config.color.color_tolerance, 40.0);
    EXPECT_DOUBLE_EQ(config.logo.threshold, 0.7);
    EXPECT_EQ(config.legal.match_mode, MatchMode::Substring);
}

TEST(GateConfig, LoadOverridesOnlyPresentKeys) {
    const auto dir = test::scratch_dir("gate_config");
    write_text(dir / "gate.json", R"({
        "logo":  {"threshold": 0.8, "scales": [1.0, 2.0]},
        "color": {"color_tolerance": 25},
        "legal": {"match_mode": "whole_word"}
    })");

    const GateConfig config = GateConfig::load(dir / "gate.json");

    EXPECT_DOUBLE_EQ(config.logo.threshold, 0.8);
    EXPECT_EQ(config.logo.scales, (std::vector<double>{1.0, 2.0}));
    EXPECT_DOUBLE_EQ(config.color.color_tolerance, 25.0);
    EXPECT_EQ(config.legal.match_mode, MatchMode::WholeWord);

    // Untouched
    EXPECT_EQ(config.palette.k, 5);
    EXPECT_EQ(config.color.shade_step, 15);
}

TEST(GateConfig, LoadRejectsBadInput) {
    const auto dir = test::scratch_dir("gate_config_bad");
    write_text(dir / "type.json", R"({"palette": {"k": "five"}})");
    write_text(dir / "range.json", R"({"logo": {"threshold": 2.0}})");
    write_text(dir / "mode.json", R"({"legal": {"match_mode": "regex"}})");
    write_text(dir / "section.json", R"({"color": 12})");
    write_text(dir / "syntax.json", "{ oops");

    EXPECT_THROW(GateConfig::load(dir / "type.json"), ConfigurationError);
    EXPECT_THROW(GateConfig::load(dir / "range.json"), ConfigurationError);
    EXPECT_THROW(GateConfig::load(dir / "mode.json"), ConfigurationError);
    EXPECT_THROW(GateConfig::load(dir / "section.json"), ConfigurationError);
    EXPECT_THROW(GateConfig::load(dir / "syntax.json"), ConfigurationError);
    EXPECT_THROW(GateConfig::load(dir / "absent.json"), ConfigurationError);
}

// -----------------------------------------------------------------------------
// BrandSpec
// -----------------------------------------------------------------------------

TEST(BrandSpec, CreateParsesColors) {
    const BrandSpec brand = BrandSpec::create(test::make_logo(), "#E65A1E", "143c78", "Inter", "bold");
    EXPECT_EQ(brand.primary_color, test::kPrimary);
    EXPECT_EQ(brand.secondary_color, test::kSecondary);
    EXPECT_EQ(brand.font_name, "Inter");
    EXPECT_EQ(brand.theme, "bold");
}

TEST(BrandSpec, CreateRejectsBadInput) {
    EXPECT_THROW(BrandSpec::create(cv::Mat(), "#E65A1E", "#143C78"), ConfigurationError);
    EXPECT_THROW(BrandSpec::create(test::make_logo(), "orange", "#143C78"), ConfigurationError);
}

TEST(BrandSpec, LoadResolvesLogoRelativeToFile) {
    const auto dir = test::scratch_dir("brand_spec");
    std::filesystem::create_directories(dir / "assets");
    ASSERT_TRUE(cv::imwrite((dir / "assets" / "logo.png").string(), test::make_logo()));
    write_text(dir / "brand.json", R"({
        "logo_path": "assets/logo.png",
        "primary_color": "#E65A1E",
        "secondary_color": "#143C78",
        "domain": "example.com"
    })");

    const BrandSpec brand = BrandSpec::load(dir / "brand.json");
    EXPECT_EQ(brand.logo.cols, 60);
    EXPECT_EQ(brand.logo.rows, 40);
    EXPECT_EQ(brand.logo_path, dir / "assets" / "logo.png");
    EXPECT_EQ(brand.domain, "example.com");
    EXPECT_TRUE(brand.font_name.empty());
}

TEST(BrandSpec, MissingLogoIsConfigurationError) {
    const auto dir = test::scratch_dir("brand_spec_missing");
    write_text(dir / "brand.json", R"({
        "logo_path": "nowhere.png",
        "primary_color": "#E65A1E",
        "secondary_color": "#143C78"
    })");
    EXPECT_THROW(BrandSpec::load(dir / "brand.json"), ConfigurationError);
}

// -----------------------------------------------------------------------------
// CampaignBrief
// -----------------------------------------------------------------------------

class CampaignBriefTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test::scratch_dir(std::string("brief_") +
                                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        ASSERT_TRUE(cv::imwrite((dir_ / "logo.png").string(), test::make_logo()));
    }

    std::filesystem::path write_brief(const std::string& message,
                                      const std::string& extra = {}) {
        const auto path = dir_ / "brief.json";
        write_text(path, R"({
            "campaign_id": "spring-launch",
            "region": "es-MX",
            "target_audience": "young adults",
            "campaign_message": ")" + message + R"(",)" + extra + R"(
            "products": [
                {"name": "Mint Paste", "description": "Fresh mint", "asset_path": "mint.png"},
                {"name": "Night Gel", "description": "Overnight care"}
            ],
            "brand": {
                "logo_path": "logo.png",
                "primary_color": "#E65A1E",
                "secondary_color": "#143C78"
            }
        })");
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(CampaignBriefTest, LoadsValidBrief) {
    const CampaignBrief brief = CampaignBrief::load(write_brief("Smile brighter"));

    EXPECT_EQ(brief.campaign_id, "spring-launch");
    EXPECT_EQ(brief.region, "es-MX");
    EXPECT_EQ(brief.campaign_message, "Smile brighter");
    EXPECT_FALSE(brief.translated_message.has_value());
    ASSERT_EQ(brief.products.size(), 2u);
    EXPECT_EQ(brief.products[0].asset_path, dir_ / "mint.png");
    EXPECT_TRUE(brief.products[1].asset_path.empty());
    EXPECT_EQ(brief.brand.primary_color, test::kPrimary);
}

TEST_F(CampaignBriefTest, ReadsTranslatedMessage) {
    const CampaignBrief brief = CampaignBrief::load(
        write_brief("Smile brighter", R"( "translated_message": "Sonrie mas",)"));
    ASSERT_TRUE(brief.translated_message.has_value());
    EXPECT_EQ(*brief.translated_message, "Sonrie mas");
}

TEST_F(CampaignBriefTest, MessageLengthIsCapped) {
    EXPECT_NO_THROW(CampaignBrief::load(write_brief(std::string(CampaignBrief::kMaxMessageLength, 'a'))));
    EXPECT_THROW(CampaignBrief::load(write_brief(std::string(CampaignBrief::kMaxMessageLength + 1, 'a'))),
                 ConfigurationError);
}

TEST_F(CampaignBriefTest, MessageLengthCountsCharactersNotBytes) {
    std::string accented;
    for (size_t i = 0; i < CampaignBrief::kMaxMessageLength; ++i) {
        accented += "\xC3\xA9";    // U+00E9, two bytes
    }
    EXPECT_NO_THROW(CampaignBrief::load(write_brief(accented)));
    EXPECT_THROW(CampaignBrief::load(write_brief(accented + "\xC3\xA9")), ConfigurationError);
}

TEST_F(CampaignBriefTest, EmptyMessageIsRejected) {
    EXPECT_THROW(CampaignBrief::load(write_brief("   ")), ConfigurationError);
}

TEST_F(CampaignBriefTest, MissingProductsIsRejected) {
    const auto path = dir_ / "no_products.json";
    write_text(path, R"({
        "campaign_id": "c", "region": "us", "target_audience": "all",
        "campaign_message": "hello", "products": [],
        "brand": {"logo_path": "logo.png", "primary_color": "#000000", "secondary_color": "#FFFFFF"}
    })");
    EXPECT_THROW(CampaignBrief::load(path), ConfigurationError);
}

}  // namespace
}  // namespace ccg
