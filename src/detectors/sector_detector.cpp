#include "sector_detector.h"
#include <algorithm>
#include <cmath>

namespace sectorscan {
namespace outliers {

double RoundScore(double score) {
    return std::round(score * 100.0) / 100.0;
}

void SortByCompositeDescending(std::vector<OutlierResult>& results) {
    auto comparable_end = std::stable_partition(results.begin(), results.end(), [](const OutlierResult& r) {
        return !std::isnan(r.composite_score);
    });
    std::stable_sort(results.begin(), comparable_end, [](const OutlierResult& a, const OutlierResult& b) {
        return a.composite_score > b.composite_score;
    });
}

std::vector<OutlierResult> DetectSectorOutliers(const std::vector<MetricRow>& rows,
                                                double threshold,
                                                const OutlierConfig& config) {
    std::vector<OutlierResult> results;
    if (rows.size() < config.min_sector_size) {
        return results;
    }

    auto stats = ComputeSectorStatistics(rows, config.stats);

    for (const auto& row : rows) {
        auto z = ComputeZScores(row, stats, config.stats);
        double composite = ComputeCompositeScore(z, config.scoring);

        // Threshold and tier use the unrounded score; only the reported value is rounded.
        if (composite >= threshold) {
            OutlierResult r;
            r.stock_id = row.stock_id;
            r.symbol = row.symbol;
            r.display_name = row.display_name;
            r.z_scores = z;
            r.composite_score = RoundScore(composite);
            r.outlier_type = ClassifyOutlier(z, config.scoring.classification_z);
            r.significance_level = ClassifySignificance(composite);
            results.push_back(std::move(r));
        }
    }

    SortByCompositeDescending(results);
    return results;
}

std::vector<SectorOutliers> DetectAllOutliers(const std::vector<SectorBatch>& sectors,
                                              double threshold,
                                              const OutlierConfig& config) {
    std::vector<SectorOutliers> summaries;
    summaries.reserve(sectors.size());
    for (const auto& [sector, rows] : sectors) {
        SectorOutliers summary;
        summary.sector = sector;
        summary.outliers = DetectSectorOutliers(rows, threshold, config);
        summary.outlier_count = summary.outliers.size();
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

} // namespace outliers
} // namespace sectorscan
