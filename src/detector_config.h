#pragma once

#include <optional>
#include <string>
#include "contract.h"

namespace sectorscan {
namespace outliers {

struct StatsConfig {
    size_t min_metric_samples = 2; // below this an optional metric has no sector stats
    double min_std_dev = 0.001; // spreads at or under this are treated as degenerate
};

struct ScoringConfig {
    // Order follows MetricId: price, P/E, P/B, volume ratio
    MetricTable<double> weights = {0.3, 0.3, 0.2, 0.2};
    double classification_z = 1.0;
};

struct OutlierConfig {
    size_t min_sector_size = 3;
    StatsConfig stats;
    ScoringConfig scoring;
};

enum class Universe {
    Sp500,
    Russell2000
};

inline const char* UniverseToString(Universe universe) {
    switch (universe) {
        case Universe::Sp500:
            return "sp500";
        case Universe::Russell2000:
            return "russell2000";
    }
    return "sp500";
}

inline std::optional<Universe> ParseUniverse(const std::string& value) {
    if (value == "sp500") return Universe::Sp500;
    if (value == "russell2000") return Universe::Russell2000;
    return std::nullopt;
}

// Small caps are noisier, so the wider universe gets a stricter default.
inline double DefaultThreshold(Universe universe) {
    return universe == Universe::Russell2000 ? 2.0 : 1.5;
}

} // namespace outliers
} // namespace sectorscan
