#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../types.h"
#include "../detector_config.h"
#include "outlier_classifier.h"

namespace sectorscan::outliers {

struct OutlierResult {
    std::int64_t stock_id = 0;
    std::string symbol;
    std::string display_name;
    ZScores z_scores;
    double composite_score = 0.0; // rounded to 2 decimals
    OutlierType outlier_type = OutlierType::Mixed;
    SignificanceLevel significance_level = SignificanceLevel::Moderate;
};

struct SectorOutliers {
    SectorInfo sector;
    size_t outlier_count = 0;
    std::vector<OutlierResult> outliers;
};

// One sector's rows, in the order the caller wants sectors reported.
using SectorBatch = std::pair<SectorInfo, std::vector<MetricRow>>;

auto RoundScore(double score) -> double;

// Strongest first. NaN scores compare equal to everything, so they are moved
// behind the comparable ones instead of being fed to the sort.
auto SortByCompositeDescending(std::vector<OutlierResult>& results) -> void;

// Flags the rows whose composite score reaches threshold. Sectors smaller
// than config.min_sector_size produce no results.
auto DetectSectorOutliers(const std::vector<MetricRow>& rows,
                          double threshold,
                          const OutlierConfig& config = OutlierConfig{}) -> std::vector<OutlierResult>;

auto DetectAllOutliers(const std::vector<SectorBatch>& sectors,
                       double threshold,
                       const OutlierConfig& config = OutlierConfig{}) -> std::vector<SectorOutliers>;

} // namespace sectorscan::outliers
