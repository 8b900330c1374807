#include "json_codec.h"
#include <fstream>
#include <stdexcept>

namespace {

template <typename T>
std::optional<T> OptionalField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

std::optional<std::int64_t> OptionalCount(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " must be an integer");
    }
    return it->get<std::int64_t>();
}

template <typename T>
void PutOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

} // namespace

void to_json(nlohmann::json& j, const SectorInfo& s) {
    j = nlohmann::json{{"id", s.id}, {"name", s.name}, {"symbol", s.symbol}};
}

void from_json(const nlohmann::json& j, SectorInfo& s) {
    s.id = j.at("id").get<int>();
    s.name = j.value("name", "");
    s.symbol = j.value("symbol", "");
}

void to_json(nlohmann::json& j, const MetricRow& r) {
    j = nlohmann::json{
        {"stock_id", r.stock_id},
        {"symbol", r.symbol},
        {"name", r.display_name},
        {"sector_id", r.sector_id},
        {"price_change_percent", r.price_change_percent}
    };
    PutOptional(j, "pe_ratio", r.pe_ratio);
    PutOptional(j, "pb_ratio", r.pb_ratio);
    PutOptional(j, "volume", r.volume);
    PutOptional(j, "avg_volume_10d", r.avg_volume_10d);
}

void from_json(const nlohmann::json& j, MetricRow& r) {
    r.stock_id = j.at("stock_id").get<std::int64_t>();
    r.symbol = j.at("symbol").get<std::string>();
    r.display_name = j.value("name", "");
    r.sector_id = j.value("sector_id", 0);
    r.price_change_percent = j.at("price_change_percent").get<double>();
    r.pe_ratio = OptionalField<double>(j, "pe_ratio");
    r.pb_ratio = OptionalField<double>(j, "pb_ratio");
    r.volume = OptionalCount(j, "volume");
    r.avg_volume_10d = OptionalCount(j, "avg_volume_10d");

    if ((r.volume && *r.volume < 0) || (r.avg_volume_10d && *r.avg_volume_10d < 0)) {
        throw std::invalid_argument("negative volume for " + r.symbol);
    }
}

namespace sectorscan {
namespace outliers {

void to_json(nlohmann::json& j, const ZScores& z) {
    j = nlohmann::json{{"price_z", z.price_z}};
    PutOptional(j, "pe_z", z.pe_z);
    PutOptional(j, "pb_z", z.pb_z);
    PutOptional(j, "volume_z", z.volume_z);
}

void from_json(const nlohmann::json& j, ZScores& z) {
    z.price_z = j.at("price_z").get<double>();
    z.pe_z = OptionalField<double>(j, "pe_z");
    z.pb_z = OptionalField<double>(j, "pb_z");
    z.volume_z = OptionalField<double>(j, "volume_z");
}

void to_json(nlohmann::json& j, const OutlierResult& r) {
    j = nlohmann::json{
        {"stock_id", r.stock_id},
        {"symbol", r.symbol},
        {"name", r.display_name},
        {"z_scores", r.z_scores},
        {"composite_score", r.composite_score},
        {"outlier_type", OutlierTypeToString(r.outlier_type)},
        {"significance_level", SignificanceToString(r.significance_level)}
    };
}

void from_json(const nlohmann::json& j, OutlierResult& r) {
    r.stock_id = j.at("stock_id").get<std::int64_t>();
    r.symbol = j.at("symbol").get<std::string>();
    r.display_name = j.value("name", "");
    r.z_scores = j.at("z_scores").get<ZScores>();
    r.composite_score = j.at("composite_score").get<double>();

    auto type = ParseOutlierType(j.at("outlier_type").get<std::string>());
    auto level = ParseSignificance(j.at("significance_level").get<std::string>());
    if (!type || !level) {
        throw std::invalid_argument("unknown outlier_type or significance_level for " + r.symbol);
    }
    r.outlier_type = *type;
    r.significance_level = *level;
}

void to_json(nlohmann::json& j, const SectorOutliers& s) {
    j = nlohmann::json{
        {"sector_id", s.sector.id},
        {"sector_name", s.sector.name},
        {"sector_symbol", s.sector.symbol},
        {"outlier_count", s.outlier_count},
        {"outliers", s.outliers}
    };
}

std::vector<SectorBatch> ParseSectorBatches(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("sectors") || !doc["sectors"].is_array()) {
        throw std::invalid_argument("input document must contain a 'sectors' array");
    }

    std::vector<SectorBatch> batches;
    for (const auto& entry : doc["sectors"]) {
        SectorBatch batch;
        batch.first = entry.get<SectorInfo>();
        if (entry.contains("rows")) {
            for (const auto& jr : entry["rows"]) {
                auto row = jr.get<MetricRow>();
                if (!jr.contains("sector_id")) {
                    row.sector_id = batch.first.id;
                }
                if (row.sector_id != batch.first.id) {
                    throw std::invalid_argument("row " + row.symbol + " does not belong to sector " +
                                                std::to_string(batch.first.id));
                }
                batch.second.push_back(std::move(row));
            }
        }
        batches.push_back(std::move(batch));
    }
    return batches;
}

std::vector<SectorBatch> LoadSectorBatches(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open input file " + path);
    }
    nlohmann::json doc = nlohmann::json::parse(in);
    return ParseSectorBatches(doc);
}

} // namespace outliers
} // namespace sectorscan
