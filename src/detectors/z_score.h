#pragma once

#include <optional>

#include "sector_stats.h"

namespace sectorscan::outliers {

struct ZScores {
    double price_z = 0.0;
    std::optional<double> pe_z;
    std::optional<double> pb_z;
    std::optional<double> volume_z;

    auto Get(MetricId id) const -> std::optional<double> {
        switch (id) {
            case MetricId::PriceChange: return price_z;
            case MetricId::PeRatio: return pe_z;
            case MetricId::PbRatio: return pb_z;
            case MetricId::VolumeRatio: return volume_z;
        }
        return std::nullopt;
    }

    auto operator==(const ZScores& other) const -> bool {
        return price_z == other.price_z && pe_z == other.pe_z &&
               pb_z == other.pb_z && volume_z == other.volume_z;
    }
};

// Z-scores of one row against its sector. price_z falls back to 0.0 when the
// sector spread is degenerate; optional metrics fall back to nullopt.
auto ComputeZScores(const MetricRow& row,
                    const SectorStatistics& stats,
                    const StatsConfig& config = StatsConfig{}) -> ZScores;

} // namespace sectorscan::outliers
