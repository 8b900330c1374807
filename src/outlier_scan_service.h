#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "detector_config.h"
#include "detectors/sector_detector.h"
#include "idb_client.h"

namespace sectorscan {

struct ScanOptions {
    outliers::OutlierConfig engine;
    size_t max_parallel_sectors = 1; // sectors computed concurrently; 1 = inline
    bool persist = true;
};

struct ScanReport {
    std::string scan_id;
    double threshold = 0.0;
    outliers::Universe universe = outliers::Universe::Sp500;
    std::vector<outliers::SectorOutliers> sectors;
    size_t persist_failures = 0;
    size_t failed_sectors = 0; // sectors whose rows could not be loaded
};

/**
 * Runs the detection engine over sectors read from the store and records each
 * flagged stock. Writes happen after all scores are computed; a failed write is
 * logged and counted but never changes the returned results.
 */
class OutlierScanService {
public:
    explicit OutlierScanService(std::shared_ptr<IDbClient> db, ScanOptions options = ScanOptions{});

    // Every sector, ordered by sector name.
    auto ScanAll(outliers::Universe universe,
                 std::optional<double> threshold = std::nullopt) -> ScanReport;

    auto ScanSector(int sector_id,
                    outliers::Universe universe,
                    std::optional<double> threshold = std::nullopt) -> ScanReport;

    // Explicit threshold when given, else the universe default. Throws
    // std::invalid_argument unless the result is finite and positive.
    static auto ResolveThreshold(outliers::Universe universe, std::optional<double> threshold) -> double;

private:
    auto Run(const std::vector<SectorInfo>& sectors, outliers::Universe universe, double threshold) -> ScanReport;
    auto Detect(const std::vector<outliers::SectorBatch>& batches, double threshold) -> std::vector<outliers::SectorOutliers>;
    auto Persist(const outliers::SectorOutliers& sector, double threshold, outliers::Universe universe) -> size_t;

    std::shared_ptr<IDbClient> db_;
    ScanOptions options_;
};

auto NewScanId() -> std::string;

} // namespace sectorscan
