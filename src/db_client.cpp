#include "db_client.h"
#include <spdlog/spdlog.h>
#include "obs/error_codes.h"
#include "obs/logging.h"

using sectorscan::outliers::OutlierResult;
using sectorscan::outliers::Universe;

namespace {

template <typename T>
std::optional<T> NullableField(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<T>();
}

void LogDbError(const char* code, const std::string& op, const std::exception& e) {
    sectorscan::obs::LogFailure(sectorscan::obs::LogLevel::Error, "db_error", "db_client", code, e, {{"op", op}});
}

} // namespace

DbClient::DbClient(const std::string& connection_string)
    : manager_(std::make_shared<SimpleDbConnectionManager>(connection_string)) {}

DbClient::DbClient(std::shared_ptr<DbConnectionManager> manager) : manager_(std::move(manager)) {}

std::vector<SectorInfo> DbClient::GetSectors() {
    std::vector<SectorInfo> sectors;
    try {
        auto conn = manager_->GetConnection();
        pqxx::nontransaction N(*conn);
        auto res = N.exec("SELECT id, name, symbol FROM sectors ORDER BY name");
        sectors.reserve(res.size());
        for (const auto& row : res) {
            SectorInfo s;
            s.id = row[0].as<int>();
            s.name = row[1].as<std::string>();
            s.symbol = row[2].as<std::string>();
            sectors.push_back(std::move(s));
        }
    } catch (const std::exception& e) {
        LogDbError(sectorscan::obs::kErrDbQueryFailed, "GetSectors", e);
        throw;
    }
    return sectors;
}

std::optional<SectorInfo> DbClient::GetSector(int sector_id) {
    try {
        auto conn = manager_->GetConnection();
        pqxx::nontransaction N(*conn);
        auto res = N.exec_params("SELECT id, name, symbol FROM sectors WHERE id = $1", sector_id);
        if (res.empty()) return std::nullopt;
        SectorInfo s;
        s.id = res[0][0].as<int>();
        s.name = res[0][1].as<std::string>();
        s.symbol = res[0][2].as<std::string>();
        return s;
    } catch (const std::exception& e) {
        LogDbError(sectorscan::obs::kErrDbQueryFailed, "GetSector", e);
        throw;
    }
}

std::vector<MetricRow> DbClient::GetLatestSectorMetrics(int sector_id, Universe universe) {
    std::vector<MetricRow> rows;
    try {
        auto conn = manager_->GetConnection();
        pqxx::nontransaction N(*conn);
        auto res = N.exec_params(
            "SELECT s.id, s.symbol, s.name, s.sector_id, "
            "       md.price_change_percent, md.pe_ratio, md.pb_ratio, md.volume, md.avg_volume_10d "
            "FROM stocks s "
            "JOIN stock_universe su ON su.stock_id = s.id "
            "     AND su.universe_type = $2 AND su.date_removed IS NULL "
            "JOIN LATERAL ( "
            "    SELECT price_change_percent, pe_ratio, pb_ratio, volume, avg_volume_10d "
            "    FROM market_data m WHERE m.stock_id = s.id "
            "    ORDER BY m.timestamp DESC, m.id DESC LIMIT 1 "
            ") md ON TRUE "
            "WHERE s.sector_id = $1 "
            "ORDER BY s.symbol",
            sector_id, std::string(sectorscan::outliers::UniverseToString(universe)));

        rows.reserve(res.size());
        for (const auto& r : res) {
            MetricRow row;
            row.stock_id = r[0].as<std::int64_t>();
            row.symbol = r[1].as<std::string>();
            row.display_name = r[2].as<std::string>();
            row.sector_id = r[3].as<int>();
            row.price_change_percent = r[4].as<double>();
            row.pe_ratio = NullableField<double>(r[5]);
            row.pb_ratio = NullableField<double>(r[6]);
            row.volume = NullableField<std::int64_t>(r[7]);
            row.avg_volume_10d = NullableField<std::int64_t>(r[8]);
            rows.push_back(std::move(row));
        }
    } catch (const std::exception& e) {
        LogDbError(sectorscan::obs::kErrDbQueryFailed, "GetLatestSectorMetrics", e);
        throw;
    }
    spdlog::debug("Loaded {} metric rows for sector {}", rows.size(), sector_id);
    return rows;
}

void DbClient::InsertOutlierDetection(const OutlierResult& result, int sector_id, double threshold, Universe universe) {
    try {
        auto conn = manager_->GetConnection();
        pqxx::work W(*conn);
        W.exec_params(
            "INSERT INTO outlier_detections (stock_id, sector_id, pe_z_score, pb_z_score, price_z_score, "
            "volume_z_score, composite_score, outlier_type, significance_level, threshold_used, universe_type) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)",
            result.stock_id, sector_id,
            result.z_scores.pe_z, result.z_scores.pb_z, result.z_scores.price_z, result.z_scores.volume_z,
            result.composite_score,
            std::string(sectorscan::outliers::OutlierTypeToString(result.outlier_type)),
            std::string(sectorscan::outliers::SignificanceToString(result.significance_level)),
            threshold,
            std::string(sectorscan::outliers::UniverseToString(universe)));
        W.commit();
    } catch (const std::exception& e) {
        LogDbError(sectorscan::obs::kErrDbInsertFailed, "InsertOutlierDetection", e);
        throw;
    }
}

long DbClient::CountDetectionsToday(int sector_id) {
    try {
        auto conn = manager_->GetConnection();
        pqxx::nontransaction N(*conn);
        auto res = N.exec_params(
            "SELECT COUNT(*) FROM outlier_detections WHERE sector_id = $1 AND detection_date = CURRENT_DATE",
            sector_id);
        return res[0][0].as<long>();
    } catch (const std::exception& e) {
        LogDbError(sectorscan::obs::kErrDbQueryFailed, "CountDetectionsToday", e);
        throw;
    }
}
