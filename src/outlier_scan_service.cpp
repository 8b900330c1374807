#include "outlier_scan_service.h"

#include <algorithm>
#include <cmath>
#include <future>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <uuid/uuid.h>

#include "obs/context.h"
#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace sectorscan {

using outliers::OutlierResult;
using outliers::SectorBatch;
using outliers::SectorOutliers;
using outliers::Universe;

std::string NewScanId() {
    uuid_t binuuid;
    uuid_generate_random(binuuid);
    char text[37];
    uuid_unparse_lower(binuuid, text);
    return std::string(text);
}

OutlierScanService::OutlierScanService(std::shared_ptr<IDbClient> db, ScanOptions options)
    : db_(std::move(db)), options_(options) {
    if (!db_) {
        throw std::invalid_argument("OutlierScanService requires a db client");
    }
}

double OutlierScanService::ResolveThreshold(Universe universe, std::optional<double> threshold) {
    double value = threshold.value_or(outliers::DefaultThreshold(universe));
    if (!std::isfinite(value) || value <= 0.0) {
        throw std::invalid_argument("threshold must be a positive number");
    }
    return value;
}

ScanReport OutlierScanService::ScanAll(Universe universe, std::optional<double> threshold) {
    double resolved = ResolveThreshold(universe, threshold);
    return Run(db_->GetSectors(), universe, resolved);
}

ScanReport OutlierScanService::ScanSector(int sector_id, Universe universe, std::optional<double> threshold) {
    double resolved = ResolveThreshold(universe, threshold);
    auto sector = db_->GetSector(sector_id);
    if (!sector) {
        throw std::invalid_argument("unknown sector id " + std::to_string(sector_id));
    }
    return Run({*sector}, universe, resolved);
}

ScanReport OutlierScanService::Run(const std::vector<SectorInfo>& sectors, Universe universe, double threshold) {
    ScanReport report;
    report.scan_id = NewScanId();
    report.threshold = threshold;
    report.universe = universe;

    obs::Context ctx;
    ctx.scan_id = report.scan_id;
    ctx.universe = outliers::UniverseToString(universe);
    obs::ScopedContext scope(ctx);
    obs::ScopedTimer timer("sector_scan", "scan_service",
                           {{"threshold", threshold}, {"sector_count", sectors.size()}});

    std::vector<SectorBatch> batches;
    batches.reserve(sectors.size());
    for (const auto& sector : sectors) {
        obs::ScopedSectorContext sector_scope(sector.id);
        SectorBatch batch{sector, {}};
        try {
            batch.second = db_->GetLatestSectorMetrics(sector.id, universe);
        } catch (const std::exception& e) {
            report.failed_sectors++;
            obs::LogFailure(obs::LogLevel::Warn, "sector_load_failed", "scan_service", obs::kErrDbQueryFailed, e);
        }
        if (batch.second.size() < options_.engine.min_sector_size) {
            obs::EmitCounter("sector_scan_skipped_sectors_total", 1, "sectors", "scan_service",
                             {{"universe", ctx.universe}}, {{"rows", batch.second.size()}});
        }
        batches.push_back(std::move(batch));
    }

    report.sectors = Detect(batches, threshold);

    size_t total_outliers = 0;
    for (const auto& summary : report.sectors) {
        total_outliers += summary.outlier_count;
        spdlog::info("Sector {} ({}): {} outliers", summary.sector.name, summary.sector.symbol, summary.outlier_count);
        if (options_.persist) {
            report.persist_failures += Persist(summary, threshold, universe);
        }
    }

    obs::EmitCounter("sector_scan_sectors_total", static_cast<long>(report.sectors.size()), "sectors", "scan_service",
                     {{"universe", ctx.universe}});
    obs::EmitCounter("sector_scan_outliers_total", static_cast<long>(total_outliers), "outliers", "scan_service",
                     {{"universe", ctx.universe}});
    obs::EmitHistogram("sector_scan_duration_ms", timer.ElapsedMs(), "ms", "scan_service");
    timer.Stop(obs::LogLevel::Info, {{"outliers", total_outliers},
                                     {"persist_failures", report.persist_failures},
                                     {"failed_sectors", report.failed_sectors}});
    return report;
}

std::vector<SectorOutliers> OutlierScanService::Detect(const std::vector<SectorBatch>& batches, double threshold) {
    size_t width = options_.max_parallel_sectors;
    if (width <= 1 || batches.size() < 2) {
        return outliers::DetectAllOutliers(batches, threshold, options_.engine);
    }

    // Each sector is independent; results keep the caller's sector order.
    std::vector<SectorOutliers> summaries(batches.size());
    for (size_t start = 0; start < batches.size(); start += width) {
        size_t end = std::min(start + width, batches.size());
        std::vector<std::future<std::vector<OutlierResult>>> pending;
        pending.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            pending.push_back(std::async(std::launch::async, [this, &batches, i, threshold]() {
                return outliers::DetectSectorOutliers(batches[i].second, threshold, options_.engine);
            }));
        }
        for (size_t i = start; i < end; ++i) {
            auto& summary = summaries[i];
            summary.sector = batches[i].first;
            summary.outliers = pending[i - start].get();
            summary.outlier_count = summary.outliers.size();
        }
    }
    return summaries;
}

size_t OutlierScanService::Persist(const SectorOutliers& sector, double threshold, Universe universe) {
    obs::ScopedSectorContext sector_scope(sector.sector.id);
    size_t failures = 0;
    for (const auto& result : sector.outliers) {
        try {
            db_->InsertOutlierDetection(result, sector.sector.id, threshold, universe);
        } catch (const std::exception& e) {
            failures++;
            obs::EmitCounter("sector_scan_persist_failures_total", 1, "writes", "scan_service");
            obs::LogFailure(obs::LogLevel::Warn, "detection_persist_failed", "scan_service", obs::kErrDbInsertFailed, e,
                            {{"stock_id", result.stock_id}, {"symbol", result.symbol}});
        }
    }
    return failures;
}

} // namespace sectorscan
