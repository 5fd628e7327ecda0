#include "core/color_validator.hpp"
#include "test_images.hpp"

#include <gtest/gtest.h>

#include <tuple>

namespace ccg {
namespace {

BrandSpec test_brand() {
    return BrandSpec::create(test::make_logo(), test::kPrimaryHex, test::kSecondaryHex);
}

cv::Mat two_color_image(const ColorSample& top, const ColorSample& bottom) {
    cv::Mat image = test::solid(120, 80, top);
    cv::rectangle(image, cv::Rect(0, 40, 120, 40), test::bgr(bottom), cv::FILLED);
    return image;
}

TEST(ColorComplianceValidator, ExactBrandColorsPass) {
    ColorComplianceValidator validator;
    const auto result = validator.validate(two_color_image(test::kPrimary, test::kSecondary), test_brand());

    EXPECT_TRUE(result.pass);
    EXPECT_TRUE(result.primary.present);
    EXPECT_TRUE(result.secondary.present);
    EXPECT_EQ(result.matched.count(test::kPrimary), 1u);
    EXPECT_EQ(result.matched.count(test::kSecondary), 1u);
    EXPECT_DOUBLE_EQ(result.primary.closest_distance, 0.0);
    EXPECT_NEAR(result.primary.coverage, 0.5, 1e-9);
}

TEST(ColorComplianceValidator, NeitherBrandColorFails) {
    const ColorSample green{0, 255, 0};
    const ColorSample gray{128, 128, 128};

    ColorComplianceValidator validator;
    const auto result = validator.validate(two_color_image(green, gray), test_brand());

    EXPECT_FALSE(result.pass);
    EXPECT_TRUE(result.matched.empty());
    EXPECT_FALSE(result.primary.present);
    EXPECT_FALSE(result.secondary.present);
}

TEST(ColorComplianceValidator, PartialPresenceIsFailure) {
    const ColorSample green{0, 255, 0};

    ColorComplianceValidator validator;
    const auto result = validator.validate(two_color_image(test::kPrimary, green), test_brand());

    EXPECT_FALSE(result.pass);
    EXPECT_TRUE(result.primary.present);
    EXPECT_FALSE(result.secondary.present);
    // The color that did match is still reported
    EXPECT_EQ(result.matched.count(test::kPrimary), 1u);
}

TEST(ColorComplianceValidator, LighterShadeCountsAsBrandColor) {
    // Exactly the lightest shade of the primary (+75 per channel)
    const ColorSample lighter{255, 165, 105};

    ColorConfig config;
    config.color_tolerance = 5.0;
    ColorComplianceValidator validator(config);
    const auto result = validator.validate(two_color_image(lighter, test::kSecondary), test_brand());

    EXPECT_TRUE(result.primary.present);
    EXPECT_EQ(result.primary.matched_shades.count(lighter), 1u);
    EXPECT_TRUE(result.pass);
}

TEST(ColorComplianceValidator, BeyondShadeRangeIsAbsent) {
    const ColorSample darker{130, 0, 0};   // Primary minus 100, past the darkest shade

    ColorConfig config;
    config.color_tolerance = 10.0;
    ColorComplianceValidator validator(config);
    const auto result = validator.validate(two_color_image(darker, test::kSecondary), test_brand());

    EXPECT_FALSE(result.primary.present);
    EXPECT_FALSE(result.pass);
}

TEST(ColorComplianceValidator, NoiseLevelClustersAreIgnored) {
    // Primary appears in a single pixel out of 10000
    cv::Mat image = test::solid(100, 100, test::kSecondary);
    cv::rectangle(image, cv::Rect(0, 0, 100, 50), test::bgr(test::kWhite), cv::FILLED);
    image.at<cv::Vec3b>(99, 99) = cv::Vec3b(test::kPrimary.b, test::kPrimary.g, test::kPrimary.r);

    ColorComplianceValidator validator;
    const auto result = validator.validate(image, test_brand());

    EXPECT_FALSE(result.primary.present);
    EXPECT_TRUE(result.secondary.present);
    EXPECT_FALSE(result.pass);

    ColorConfig lenient;
    lenient.min_cluster_weight = 0.0;
    const auto lenient_result = ColorComplianceValidator(lenient).validate(image, test_brand());
    EXPECT_TRUE(lenient_result.primary.present);
}

TEST(ColorComplianceValidator, TransparentCreativeIsInvalid) {
    cv::Mat image(10, 10, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    EXPECT_THROW((void)ColorComplianceValidator{}.validate(image, test_brand()), InvalidImageError);
}

// -----------------------------------------------------------------------------
// Tolerance policy, parametrized
//
// Offsetting the brand color by (+d, -d, 0) moves it away from every shade;
// the nearest shade is the original at distance d * sqrt(2).
// -----------------------------------------------------------------------------

class ToleranceTest : public ::testing::TestWithParam<std::tuple<double, int, bool>> {};

TEST_P(ToleranceTest, PresenceFollowsTolerance) {
    const auto [tolerance, d, expected] = GetParam();

    const ColorSample base{100, 100, 100};
    const ColorSample shifted{
        static_cast<std::uint8_t>(100 + d),
        static_cast<std::uint8_t>(100 - d),
        100
    };

    ColorConfig config;
    config.color_tolerance = tolerance;
    ColorComplianceValidator validator(config);

    const Palette palette{PaletteEntry{shifted, 1.0}};
    const auto match = validator.match_color(base, palette);

    EXPECT_EQ(match.present, expected);
    EXPECT_NEAR(match.closest_distance, d * std::sqrt(2.0), 1e-9);
}

INSTANTIATE_TEST_SUITE_P(
    Tolerances, ToleranceTest,
    ::testing::Values(
        std::make_tuple(10.0, 5, true),     //  7.07 <= 10
        std::make_tuple(10.0, 8, false),    // 11.31 >  10
        std::make_tuple(40.0, 28, true),    // 39.60 <= 40
        std::make_tuple(40.0, 29, false),   // 41.01 >  40
        std::make_tuple(60.0, 42, true),    // 59.40 <= 60
        std::make_tuple(60.0, 43, false))); // 60.81 >  60

}  // namespace
}  // namespace ccg
