#pragma once

#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "obs/context.h"

namespace sectorscan {
namespace obs {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

inline const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

inline std::string NowIso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto secs = time_point_cast<seconds>(now);
    auto ms = duration_cast<milliseconds>(now - secs).count();
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

inline void AppendContext(nlohmann::json& j) {
    if (!HasContext()) return;
    const auto& ctx = GetContext();
    if (!ctx.request_id.empty()) j["request_id"] = ctx.request_id;
    if (!ctx.scan_id.empty()) j["scan_id"] = ctx.scan_id;
    if (!ctx.universe.empty()) j["universe"] = ctx.universe;
    if (ctx.sector_id) j["sector_id"] = *ctx.sector_id;
}

inline void LogEvent(LogLevel level,
                     const std::string& event,
                     const std::string& component,
                     const nlohmann::json& fields = nlohmann::json::object()) {
    nlohmann::json j = fields;
    j["ts"] = NowIso8601();
    j["level"] = LevelToString(level);
    j["event"] = event;
    j["component"] = component;
    AppendContext(j);

    // Tickers and names come from the store unvalidated; bad UTF-8 must not throw here.
    auto line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    switch (level) {
        case LogLevel::Debug:
            spdlog::debug(line);
            break;
        case LogLevel::Info:
            spdlog::info(line);
            break;
        case LogLevel::Warn:
            spdlog::warn(line);
            break;
        case LogLevel::Error:
            spdlog::error(line);
            break;
    }
}

// Failure event carrying one of the codes from obs/error_codes.h.
inline void LogFailure(LogLevel level,
                       const std::string& event,
                       const std::string& component,
                       const char* error_code,
                       const std::exception& e,
                       nlohmann::json fields = nlohmann::json::object()) {
    fields["error_code"] = error_code;
    fields["error"] = e.what();
    LogEvent(level, event, component, fields);
}

class ScopedTimer {
public:
    ScopedTimer(std::string event, std::string component, nlohmann::json fields = nlohmann::json::object())
        : event_(std::move(event)),
          component_(std::move(component)),
          fields_(std::move(fields)),
          start_(std::chrono::steady_clock::now()) {}

    double ElapsedMs() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

    void Stop(LogLevel level = LogLevel::Info, nlohmann::json extra = nlohmann::json::object()) {
        if (stopped_) return;
        stopped_ = true;
        nlohmann::json payload = fields_;
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            payload[it.key()] = it.value();
        }
        payload["duration_ms"] = ElapsedMs();
        LogEvent(level, event_, component_, payload);
    }

    ~ScopedTimer() {
        if (!stopped_) {
            Stop(LogLevel::Info);
        }
    }

private:
    std::string event_;
    std::string component_;
    nlohmann::json fields_;
    std::chrono::steady_clock::time_point start_;
    bool stopped_ = false;
};

} // namespace obs
} // namespace sectorscan
