#pragma once

#include <optional>
#include <vector>

#include "../contract.h"
#include "../detector_config.h"

namespace sectorscan::outliers {

struct MeanStd {
    double mean = 0.0;
    double std_dev = 0.0; // sample std dev, n-1 denominator
};

// Empty sample -> (0, 0); single sample -> (x, 0).
auto ComputeMeanStd(const std::vector<double>& values) -> MeanStd;

struct SectorStatistics {
    MetricTable<std::optional<MeanStd>> metrics;
    size_t row_count = 0;

    auto Get(MetricId id) const -> const std::optional<MeanStd>& { return metrics[Index(id)]; }

    // Always populated by ComputeSectorStatistics.
    [[nodiscard]] auto price() const -> MeanStd { return metrics[Index(MetricId::PriceChange)].value_or(MeanStd{}); }
};

// Price change stats come from every row; the optional metrics need
// config.min_metric_samples defined values or they are left empty.
auto ComputeSectorStatistics(const std::vector<MetricRow>& rows,
                             const StatsConfig& config = StatsConfig{}) -> SectorStatistics;

} // namespace sectorscan::outliers
