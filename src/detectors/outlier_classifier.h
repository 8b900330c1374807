#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "z_score.h"

namespace sectorscan::outliers {

enum class OutlierType {
    Undervalued,
    Overvalued,
    Momentum,
    ValueTrap,
    GrowthPremium,
    Mixed
};

enum class SignificanceLevel {
    Moderate,
    Strong,
    Extreme
};

auto OutlierTypeToString(OutlierType type) -> const char*;
auto SignificanceToString(SignificanceLevel level) -> const char*;
auto ParseOutlierType(const std::string& value) -> std::optional<OutlierType>;
auto ParseSignificance(const std::string& value) -> std::optional<SignificanceLevel>;

// Weighted RMS over the defined z-scores. Sign is discarded and missing
// metrics drop out of both the sum and the weight total.
auto ComputeCompositeScore(const ZScores& z, const ScoringConfig& config = ScoringConfig{}) -> double;

struct ClassificationRule {
    std::string name;
    OutlierType type;
    // Receives the z-scores and the classification cut-off (1.0 by default).
    std::function<bool(const ZScores&, double)> matches;
};

// Rules in priority order; the first match wins.
auto DefaultClassificationRules() -> const std::vector<ClassificationRule>&;

// Returns Mixed when no rule matches.
auto ClassifyOutlier(const ZScores& z,
                     double z_cutoff = 1.0,
                     const std::vector<ClassificationRule>& rules = DefaultClassificationRules()) -> OutlierType;

// [0, 2) Moderate, [2, 3) Strong, [3, inf) Extreme
auto ClassifySignificance(double composite_score) -> SignificanceLevel;

} // namespace sectorscan::outliers
