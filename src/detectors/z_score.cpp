#include "z_score.h"

namespace sectorscan {
namespace outliers {

namespace {

std::optional<double> OptionalZ(const std::optional<double>& value,
                                const std::optional<MeanStd>& stat,
                                double min_std_dev) {
    if (!value || !stat || stat->std_dev <= min_std_dev) {
        return std::nullopt;
    }
    return (*value - stat->mean) / stat->std_dev;
}

} // namespace

ZScores ComputeZScores(const MetricRow& row, const SectorStatistics& stats, const StatsConfig& config) {
    ZScores z;
    auto values = MetricValues::FromRow(row);

    auto price = stats.price();
    if (price.std_dev > config.min_std_dev) {
        z.price_z = (values.price_change() - price.mean) / price.std_dev;
    }

    z.pe_z = OptionalZ(values.pe_ratio(), stats.Get(MetricId::PeRatio), config.min_std_dev);
    z.pb_z = OptionalZ(values.pb_ratio(), stats.Get(MetricId::PbRatio), config.min_std_dev);
    z.volume_z = OptionalZ(values.volume_ratio(), stats.Get(MetricId::VolumeRatio), config.min_std_dev);
    return z;
}

} // namespace outliers
} // namespace sectorscan
