#pragma once
#include "types.h"
#include "detector_config.h"
#include "detectors/sector_detector.h"
#include <optional>
#include <vector>

// Storage boundary of the scanner: latest-per-stock metric snapshots in,
// detection history out. Implementations throw on failure.
class IDbClient {
public:
    virtual ~IDbClient() = default;

    // Sectors ordered by name.
    virtual auto GetSectors() -> std::vector<SectorInfo> = 0;

    virtual auto GetSector(int sector_id) -> std::optional<SectorInfo> = 0;

    // Latest market_data snapshot of each active universe member in the sector.
    virtual auto GetLatestSectorMetrics(int sector_id,
                                        sectorscan::outliers::Universe universe) -> std::vector<MetricRow> = 0;

    virtual auto InsertOutlierDetection(const sectorscan::outliers::OutlierResult& result,
                                        int sector_id,
                                        double threshold,
                                        sectorscan::outliers::Universe universe) -> void = 0;
};
