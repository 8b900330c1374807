#include "sector_stats.h"
#include <cmath>
#include <numeric>

namespace sectorscan {
namespace outliers {

MeanStd ComputeMeanStd(const std::vector<double>& values) {
    MeanStd out;
    if (values.empty()) return out;

    double n = static_cast<double>(values.size());
    out.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
    if (values.size() < 2) return out;

    double sq_dev = 0.0;
    for (double v : values) {
        sq_dev += (v - out.mean) * (v - out.mean);
    }
    out.std_dev = std::sqrt(sq_dev / (n - 1.0));
    return out;
}

SectorStatistics ComputeSectorStatistics(const std::vector<MetricRow>& rows, const StatsConfig& config) {
    SectorStatistics stats;
    stats.row_count = rows.size();

    MetricTable<std::vector<double>> samples;
    for (auto& s : samples) s.reserve(rows.size());

    for (const auto& row : rows) {
        auto values = MetricValues::FromRow(row);
        for (MetricId id : kAllMetrics) {
            if (const auto& v = values.Get(id)) {
                samples[Index(id)].push_back(*v);
            }
        }
    }

    // Price change has no nulls, so it is computed even for tiny samples.
    stats.metrics[Index(MetricId::PriceChange)] = ComputeMeanStd(samples[Index(MetricId::PriceChange)]);

    for (MetricId id : {MetricId::PeRatio, MetricId::PbRatio, MetricId::VolumeRatio}) {
        const auto& sample = samples[Index(id)];
        if (sample.size() >= config.min_metric_samples && sample.size() >= 2) {
            stats.metrics[Index(id)] = ComputeMeanStd(sample);
        }
    }
    return stats;
}

} // namespace outliers
} // namespace sectorscan
