#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "db_client.h"
#include "db_connection_manager.h"
#include "json_codec.h"
#include "metrics.h"
#include "obs/error_codes.h"
#include "obs/logging.h"
#include "outlier_scan_service.h"
#include "scan_config.h"

using namespace sectorscan;
using namespace sectorscan::outliers;

namespace {

nlohmann::json RunOffline(const ScanConfig& config) {
    auto batches = LoadSectorBatches(config.input_path);
    if (config.sector_id) {
        std::vector<SectorBatch> selected;
        for (auto& batch : batches) {
            if (batch.first.id == *config.sector_id) selected.push_back(std::move(batch));
        }
        if (selected.empty()) {
            throw std::invalid_argument("sector " + std::to_string(*config.sector_id) + " not found in input");
        }
        batches = std::move(selected);
    }

    double threshold = OutlierScanService::ResolveThreshold(config.universe, config.threshold);
    spdlog::info("Scoring {} sectors from {} (threshold {:.2f})", batches.size(), config.input_path, threshold);
    return DetectAllOutliers(batches, threshold, OutlierConfig{});
}

nlohmann::json RunAgainstDb(const ScanConfig& config) {
    PoolOptions pool;
    pool.size = config.pool_size;
    auto manager = std::make_shared<PooledDbConnectionManager>(config.db_conn_str, pool);
    auto db = std::make_shared<DbClient>(manager);

    ScanOptions options;
    options.max_parallel_sectors = config.max_parallel_sectors;
    options.persist = config.persist;
    OutlierScanService service(db, options);

    auto report = config.sector_id ? service.ScanSector(*config.sector_id, config.universe, config.threshold)
                                   : service.ScanAll(config.universe, config.threshold);
    if (report.persist_failures > 0) {
        spdlog::warn("{} detections could not be recorded", report.persist_failures);
    }
    return report.sectors;
}

void WriteOutput(const ScanConfig& config, const nlohmann::json& out) {
    if (config.output_path.empty()) {
        std::cout << out.dump(2) << std::endl;
        return;
    }
    std::ofstream file(config.output_path);
    if (!file) {
        throw std::runtime_error("cannot open output file " + config.output_path);
    }
    file << out.dump(2) << std::endl;
    spdlog::info("Wrote results to {}", config.output_path);
}

} // namespace

int main(int argc, char** argv) {
    // Logs go to stderr so stdout carries only the JSON result.
    auto console = spdlog::stderr_color_mt("console");
    spdlog::set_default_logger(console);

    ScanConfig config;
    try {
        config = ParseScanArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        obs::LogFailure(obs::LogLevel::Error, "invalid_arguments", "outlier_scan", obs::kErrConfigInvalid, e);
        std::cerr << ScanUsage();
        return 2;
    }
    if (config.show_help) {
        std::cout << ScanUsage();
        return 0;
    }
    spdlog::set_level(config.log_level);
    spdlog::info("Sector outlier scan starting (universe {})", UniverseToString(config.universe));

    nlohmann::json out;
    try {
        out = config.input_path.empty() ? RunAgainstDb(config) : RunOffline(config);
    } catch (const nlohmann::json::exception& e) {
        obs::LogFailure(obs::LogLevel::Error, "input_parse_failed", "outlier_scan", obs::kErrInputParseError, e);
        return 1;
    } catch (const std::exception& e) {
        obs::LogFailure(obs::LogLevel::Error, "scan_failed", "outlier_scan", obs::kErrInternal, e);
        return 1;
    }

    try {
        WriteOutput(config, out);
    } catch (const std::exception& e) {
        obs::LogFailure(obs::LogLevel::Error, "output_write_failed", "outlier_scan", obs::kErrOutputWriteFailed, e);
        return 1;
    }

    spdlog::debug("Metrics:\n{}", metrics::MetricsRegistry::Instance().ToPrometheus());
    spdlog::info("Sector outlier scan complete.");
    return 0;
}
