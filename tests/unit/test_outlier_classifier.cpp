#include <gtest/gtest.h>
#include <cmath>
#include "detectors/outlier_classifier.h"

using namespace sectorscan::outliers;

namespace {

ZScores Z(double price, std::optional<double> pe = std::nullopt, std::optional<double> pb = std::nullopt,
          std::optional<double> vol = std::nullopt) {
    ZScores z;
    z.price_z = price;
    z.pe_z = pe;
    z.pb_z = pb;
    z.volume_z = vol;
    return z;
}

} // namespace

TEST(CompositeScoreTest, PriceOnly) {
    EXPECT_DOUBLE_EQ(ComputeCompositeScore(Z(1.0)), 1.0);
    EXPECT_DOUBLE_EQ(ComputeCompositeScore(Z(0.0)), 0.0);
}

TEST(CompositeScoreTest, AllTwosIsExactlyTwo) {
    double score = ComputeCompositeScore(Z(2.0, 2.0, 2.0, 2.0));
    EXPECT_EQ(score, 2.0);
    EXPECT_EQ(ClassifySignificance(score), SignificanceLevel::Strong);
}

TEST(CompositeScoreTest, MissingMetricsDoNotDilute) {
    // Price 3 alone scores 3; adding an absent P/E must not pull it toward 0.
    EXPECT_DOUBLE_EQ(ComputeCompositeScore(Z(3.0)), 3.0);
    // Price 0 with P/E 2: sqrt(0.3*4 / 0.6)
    EXPECT_NEAR(ComputeCompositeScore(Z(0.0, 2.0)), std::sqrt(2.0), 1e-12);
}

TEST(CompositeScoreTest, WeightsFollowMetricTable) {
    // sqrt((0.3*1 + 0.2*9) / 0.5)
    EXPECT_NEAR(ComputeCompositeScore(Z(1.0, std::nullopt, 3.0)), std::sqrt(2.1 / 0.5), 1e-12);
}

TEST(CompositeScoreTest, InvariantUnderNegation) {
    std::vector<ZScores> cases = {
        Z(1.3, -0.7, 2.2, 0.4),
        Z(-2.5, std::nullopt, 1.1, -3.0),
        Z(0.2, 4.0, std::nullopt, std::nullopt),
    };
    for (const auto& z : cases) {
        auto neg = Z(-z.price_z,
                     z.pe_z ? std::optional<double>(-*z.pe_z) : std::nullopt,
                     z.pb_z ? std::optional<double>(-*z.pb_z) : std::nullopt,
                     z.volume_z ? std::optional<double>(-*z.volume_z) : std::nullopt);
        EXPECT_DOUBLE_EQ(ComputeCompositeScore(z), ComputeCompositeScore(neg));
    }
}

TEST(CompositeScoreTest, ZeroWeightsScoreZero) {
    ScoringConfig config;
    config.weights = {0.0, 0.0, 0.0, 0.0};
    EXPECT_DOUBLE_EQ(ComputeCompositeScore(Z(5.0, 5.0), config), 0.0);
}

TEST(ClassifyOutlierTest, Undervalued) {
    EXPECT_EQ(ClassifyOutlier(Z(0.0, -1.5, -1.5)), OutlierType::Undervalued);
}

TEST(ClassifyOutlierTest, OvervaluedWithoutPriceOrVolume) {
    EXPECT_EQ(ClassifyOutlier(Z(0.0, 2.0, 2.0)), OutlierType::Overvalued);
}

TEST(ClassifyOutlierTest, Momentum) {
    EXPECT_EQ(ClassifyOutlier(Z(2.0, std::nullopt, std::nullopt, 1.5)), OutlierType::Momentum);
}

TEST(ClassifyOutlierTest, ValueTrapWhenPbMissing) {
    EXPECT_EQ(ClassifyOutlier(Z(-2.0, -2.0, std::nullopt)), OutlierType::ValueTrap);
}

TEST(ClassifyOutlierTest, GrowthPremiumWhenPbMissing) {
    EXPECT_EQ(ClassifyOutlier(Z(2.0, 2.0)), OutlierType::GrowthPremium);
}

TEST(ClassifyOutlierTest, EarlierRuleWins) {
    // Cheap on both multiples and falling: Undervalued outranks ValueTrap.
    EXPECT_EQ(ClassifyOutlier(Z(-2.0, -2.0, -2.0)), OutlierType::Undervalued);
    // Rich on both and rising on volume: Overvalued outranks Momentum and GrowthPremium.
    EXPECT_EQ(ClassifyOutlier(Z(2.0, 2.0, 2.0, 2.0)), OutlierType::Overvalued);
    // Rising on volume with a rich P/E: Momentum outranks GrowthPremium.
    EXPECT_EQ(ClassifyOutlier(Z(2.0, 2.0, std::nullopt, 2.0)), OutlierType::Momentum);
}

TEST(ClassifyOutlierTest, BoundaryValuesDoNotTrigger) {
    EXPECT_EQ(ClassifyOutlier(Z(0.0, -1.0, -1.0)), OutlierType::Mixed);
    EXPECT_EQ(ClassifyOutlier(Z(1.0, 1.0, 1.0, 1.0)), OutlierType::Mixed);
    EXPECT_EQ(ClassifyOutlier(Z(-1.0, -1.0)), OutlierType::Mixed);
}

TEST(ClassifyOutlierTest, MissingScoresNeverMatch) {
    EXPECT_EQ(ClassifyOutlier(Z(5.0)), OutlierType::Mixed);
    EXPECT_EQ(ClassifyOutlier(Z(0.0, std::nullopt, -3.0)), OutlierType::Mixed);
    EXPECT_EQ(ClassifyOutlier(Z(0.0, std::nullopt, std::nullopt, 4.0)), OutlierType::Mixed);
}

TEST(ClassifyOutlierTest, MixedDirections) {
    EXPECT_EQ(ClassifyOutlier(Z(-2.0, 2.0, -2.0, 2.0)), OutlierType::Mixed);
}

TEST(ClassificationRulesTest, DefaultOrder) {
    const auto& rules = DefaultClassificationRules();
    ASSERT_EQ(rules.size(), 5u);
    EXPECT_EQ(rules[0].type, OutlierType::Undervalued);
    EXPECT_EQ(rules[1].type, OutlierType::Overvalued);
    EXPECT_EQ(rules[2].type, OutlierType::Momentum);
    EXPECT_EQ(rules[3].type, OutlierType::ValueTrap);
    EXPECT_EQ(rules[4].type, OutlierType::GrowthPremium);
}

TEST(ClassificationRulesTest, EachRuleIgnoresMissingScores) {
    auto empty = Z(0.0);
    for (const auto& rule : DefaultClassificationRules()) {
        EXPECT_FALSE(rule.matches(empty, 1.0)) << rule.name;
    }
}

TEST(ClassificationRulesTest, CustomRuleList) {
    std::vector<ClassificationRule> rules = {
        {"any_price_move", OutlierType::Momentum, [](const ZScores& z, double c) { return std::abs(z.price_z) > c; }},
    };
    EXPECT_EQ(ClassifyOutlier(Z(-1.5), 1.0, rules), OutlierType::Momentum);
    EXPECT_EQ(ClassifyOutlier(Z(-1.5), 2.0, rules), OutlierType::Mixed);
}

TEST(SignificanceTest, TierBoundaries) {
    EXPECT_EQ(ClassifySignificance(0.0), SignificanceLevel::Moderate);
    EXPECT_EQ(ClassifySignificance(1.999), SignificanceLevel::Moderate);
    EXPECT_EQ(ClassifySignificance(2.0), SignificanceLevel::Strong);
    EXPECT_EQ(ClassifySignificance(2.999), SignificanceLevel::Strong);
    EXPECT_EQ(ClassifySignificance(3.0), SignificanceLevel::Extreme);
    EXPECT_EQ(ClassifySignificance(12.0), SignificanceLevel::Extreme);
}

TEST(EnumStringTest, RoundTripsNames) {
    EXPECT_STREQ(OutlierTypeToString(OutlierType::ValueTrap), "ValueTrap");
    EXPECT_STREQ(SignificanceToString(SignificanceLevel::Extreme), "Extreme");
    EXPECT_EQ(ParseOutlierType("GrowthPremium"), OutlierType::GrowthPremium);
    EXPECT_FALSE(ParseOutlierType("growth").has_value());
    EXPECT_EQ(ParseSignificance("Strong"), SignificanceLevel::Strong);
}
