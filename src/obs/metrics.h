#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "../metrics.h"
#include "logging.h"

namespace sectorscan {
namespace obs {

namespace detail {

inline nlohmann::json MetricPayload(const std::string& name,
                                    const nlohmann::json& value,
                                    const std::string& unit,
                                    const metrics::Labels& labels,
                                    const nlohmann::json& fields) {
    nlohmann::json payload = fields;
    payload["metric_name"] = name;
    payload["value"] = value;
    payload["unit"] = unit;
    if (!labels.empty()) {
        nlohmann::json l = nlohmann::json::object();
        for (const auto& kv : labels) {
            l[kv.first] = kv.second;
        }
        payload["labels"] = l;
    }
    return payload;
}

} // namespace detail

inline void EmitCounter(const std::string& name,
                        long value,
                        const std::string& unit,
                        const std::string& component,
                        const metrics::Labels& labels = {},
                        const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().Increment(name, labels, value);
    LogEvent(LogLevel::Info, "metric", component, detail::MetricPayload(name, value, unit, labels, fields));
}

inline void EmitGauge(const std::string& name,
                      double value,
                      const std::string& unit,
                      const std::string& component,
                      const metrics::Labels& labels = {},
                      const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().SetGauge(name, value, labels);
    LogEvent(LogLevel::Info, "metric", component, detail::MetricPayload(name, value, unit, labels, fields));
}

inline void EmitHistogram(const std::string& name,
                          double value,
                          const std::string& unit,
                          const std::string& component,
                          const metrics::Labels& labels = {},
                          const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().RecordLatency(name, labels, value);
    LogEvent(LogLevel::Info, "metric", component, detail::MetricPayload(name, value, unit, labels, fields));
}

} // namespace obs
} // namespace sectorscan
