#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>
#include "types.h"

namespace sectorscan::outliers {

// Tracked metrics, in table order.
enum class MetricId : size_t {
    PriceChange = 0,
    PeRatio = 1,
    PbRatio = 2,
    VolumeRatio = 3
};

inline constexpr size_t kMetricCount = 4;

template <typename T>
using MetricTable = std::array<T, kMetricCount>;

inline constexpr auto Index(MetricId id) -> size_t { return static_cast<size_t>(id); }

inline constexpr std::array<MetricId, kMetricCount> kAllMetrics = {
    MetricId::PriceChange, MetricId::PeRatio, MetricId::PbRatio, MetricId::VolumeRatio
};

// Raw per-row values keyed by metric. Price change is always set.
struct MetricValues {
    MetricTable<std::optional<double>> data;

    auto Get(MetricId id) const -> const std::optional<double>& { return data[Index(id)]; }

    [[nodiscard]] auto price_change() const -> double { return data[Index(MetricId::PriceChange)].value_or(0.0); }
    [[nodiscard]] auto pe_ratio() const -> const std::optional<double>& { return Get(MetricId::PeRatio); }
    [[nodiscard]] auto pb_ratio() const -> const std::optional<double>& { return Get(MetricId::PbRatio); }
    [[nodiscard]] auto volume_ratio() const -> const std::optional<double>& { return Get(MetricId::VolumeRatio); }

    // volume_ratio is only defined when both volumes are known and the 10d average is positive.
    static auto FromRow(const MetricRow& row) -> MetricValues {
        MetricValues v;
        v.data[Index(MetricId::PriceChange)] = row.price_change_percent;
        v.data[Index(MetricId::PeRatio)] = row.pe_ratio;
        v.data[Index(MetricId::PbRatio)] = row.pb_ratio;
        if (row.volume && row.avg_volume_10d && *row.avg_volume_10d > 0) {
            v.data[Index(MetricId::VolumeRatio)] =
                static_cast<double>(*row.volume) / static_cast<double>(*row.avg_volume_10d);
        }
        return v;
    }
};

struct MetricMetadata {
    static auto GetMetricNames() -> const std::vector<std::string>& {
        static const std::vector<std::string> names = {
            "price_change_percent",
            "pe_ratio",
            "pb_ratio",
            "volume_ratio"
        };
        return names;
    }

    static auto Name(MetricId id) -> const std::string& {
        return GetMetricNames()[Index(id)];
    }
};

} // namespace sectorscan::outliers
