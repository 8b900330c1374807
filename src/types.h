#pragma once
#include <cstdint>
#include <optional>
#include <string>

struct SectorInfo {
    int id = 0;
    std::string name;
    std::string symbol; // sector ETF ticker, e.g. XLK
};

// Latest snapshot of one stock, pre-filtered to a single sector.
struct MetricRow {
    std::int64_t stock_id = 0;
    std::string symbol;
    std::string display_name;
    int sector_id = 0;

    double price_change_percent = 0.0;
    std::optional<double> pe_ratio;
    std::optional<double> pb_ratio;
    std::optional<std::int64_t> volume;
    std::optional<std::int64_t> avg_volume_10d;
};
