#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.h"
#include "detectors/sector_detector.h"

// ADL hooks for nlohmann::json. Optional metrics are written as null.
void to_json(nlohmann::json& j, const SectorInfo& s);
void from_json(const nlohmann::json& j, SectorInfo& s);
void to_json(nlohmann::json& j, const MetricRow& r);
void from_json(const nlohmann::json& j, MetricRow& r);

namespace sectorscan::outliers {

void to_json(nlohmann::json& j, const ZScores& z);
void from_json(const nlohmann::json& j, ZScores& z);
void to_json(nlohmann::json& j, const OutlierResult& r);
void from_json(const nlohmann::json& j, OutlierResult& r);
void to_json(nlohmann::json& j, const SectorOutliers& s);

// {"sectors": [{"id", "name", "symbol", "rows": [...]}]}
// Rows without a sector_id inherit the enclosing sector's id.
// Throws std::invalid_argument on a structurally wrong document.
auto ParseSectorBatches(const nlohmann::json& doc) -> std::vector<SectorBatch>;

auto LoadSectorBatches(const std::string& path) -> std::vector<SectorBatch>;

} // namespace sectorscan::outliers
