#pragma once
#include "idb_client.h"
#include "db_connection_manager.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class DbClient : public IDbClient {
public:
    explicit DbClient(const std::string& connection_string);
    explicit DbClient(std::shared_ptr<DbConnectionManager> manager);
    auto operator=(const DbClient&) -> DbClient& = delete;
    DbClient(const DbClient&) = delete;
    ~DbClient() override = default;

    auto GetSectors() -> std::vector<SectorInfo> override;

    auto GetSector(int sector_id) -> std::optional<SectorInfo> override;

    auto GetLatestSectorMetrics(int sector_id,
                                sectorscan::outliers::Universe universe) -> std::vector<MetricRow> override;

    auto InsertOutlierDetection(const sectorscan::outliers::OutlierResult& result,
                                int sector_id,
                                double threshold,
                                sectorscan::outliers::Universe universe) -> void override;

    // Number of stored detections for a sector on the current date; used by tooling and tests.
    auto CountDetectionsToday(int sector_id) -> long;

private:
    std::shared_ptr<DbConnectionManager> manager_;
};
