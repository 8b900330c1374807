#include "outlier_classifier.h"
#include <cmath>

namespace sectorscan {
namespace outliers {

namespace {

// A missing z-score never satisfies a threshold.
bool Below(const std::optional<double>& z, double cutoff) { return z.has_value() && *z < -cutoff; }
bool Above(const std::optional<double>& z, double cutoff) { return z.has_value() && *z > cutoff; }

} // namespace

const char* OutlierTypeToString(OutlierType type) {
    switch (type) {
        case OutlierType::Undervalued: return "Undervalued";
        case OutlierType::Overvalued: return "Overvalued";
        case OutlierType::Momentum: return "Momentum";
        case OutlierType::ValueTrap: return "ValueTrap";
        case OutlierType::GrowthPremium: return "GrowthPremium";
        case OutlierType::Mixed: return "Mixed";
    }
    return "Mixed";
}

const char* SignificanceToString(SignificanceLevel level) {
    switch (level) {
        case SignificanceLevel::Moderate: return "Moderate";
        case SignificanceLevel::Strong: return "Strong";
        case SignificanceLevel::Extreme: return "Extreme";
    }
    return "Moderate";
}

std::optional<OutlierType> ParseOutlierType(const std::string& value) {
    for (auto type : {OutlierType::Undervalued, OutlierType::Overvalued, OutlierType::Momentum,
                      OutlierType::ValueTrap, OutlierType::GrowthPremium, OutlierType::Mixed}) {
        if (value == OutlierTypeToString(type)) return type;
    }
    return std::nullopt;
}

std::optional<SignificanceLevel> ParseSignificance(const std::string& value) {
    for (auto level : {SignificanceLevel::Moderate, SignificanceLevel::Strong, SignificanceLevel::Extreme}) {
        if (value == SignificanceToString(level)) return level;
    }
    return std::nullopt;
}

double ComputeCompositeScore(const ZScores& z, const ScoringConfig& config) {
    double weighted_sum = 0.0;
    double total_weight = 0.0;

    for (MetricId id : kAllMetrics) {
        auto value = z.Get(id);
        if (!value) continue;
        double w = config.weights[Index(id)];
        weighted_sum += w * (*value) * (*value);
        total_weight += w;
    }

    if (total_weight > 0.0) {
        return std::sqrt(weighted_sum / total_weight);
    }
    return 0.0;
}

const std::vector<ClassificationRule>& DefaultClassificationRules() {
    static const std::vector<ClassificationRule> rules = {
        {"cheap_on_both_multiples", OutlierType::Undervalued,
         [](const ZScores& z, double c) { return Below(z.pe_z, c) && Below(z.pb_z, c); }},
        {"rich_on_both_multiples", OutlierType::Overvalued,
         [](const ZScores& z, double c) { return Above(z.pe_z, c) && Above(z.pb_z, c); }},
        {"price_up_on_volume", OutlierType::Momentum,
         [](const ZScores& z, double c) { return Above(z.price_z, c) && Above(z.volume_z, c); }},
        {"cheap_and_falling", OutlierType::ValueTrap,
         [](const ZScores& z, double c) { return Below(z.pe_z, c) && Below(z.price_z, c); }},
        {"rich_and_rising", OutlierType::GrowthPremium,
         [](const ZScores& z, double c) { return Above(z.pe_z, c) && Above(z.price_z, c); }},
    };
    return rules;
}

OutlierType ClassifyOutlier(const ZScores& z, double z_cutoff, const std::vector<ClassificationRule>& rules) {
    for (const auto& rule : rules) {
        if (rule.matches(z, z_cutoff)) {
            return rule.type;
        }
    }
    return OutlierType::Mixed;
}

SignificanceLevel ClassifySignificance(double composite_score) {
    if (composite_score >= 3.0) {
        return SignificanceLevel::Extreme;
    }
    if (composite_score >= 2.0) {
        return SignificanceLevel::Strong;
    }
    return SignificanceLevel::Moderate;
}

} // namespace outliers
} // namespace sectorscan
