#include "db_connection_manager.h"
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"

PooledDbConnectionManager::PooledDbConnectionManager(std::string conn_str, PoolOptions options)
    : conn_str_(std::move(conn_str)), options_(options) {
    if (options_.size == 0) {
        throw std::invalid_argument("DB pool size must be at least 1");
    }
    spdlog::info("Initializing DB connection pool with size {}", options_.size);
}

PooledDbConnectionManager::~PooledDbConnectionManager() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    while (!idle_.empty()) {
        idle_.pop();
    }
    cv_.notify_all();
}

auto PooledDbConnectionManager::GetConnection() -> DbConnectionPtr {
    std::unique_lock<std::mutex> lock(mutex_);
    auto start = std::chrono::steady_clock::now();

    if (!cv_.wait_for(lock, options_.acquire_timeout, [this]() {
        return !idle_.empty() || in_use_ < options_.size || shutdown_;
    })) {
        total_timeouts_++;
        sectorscan::obs::EmitCounter("db_pool_timeouts_total", 1, "timeouts", "db_pool");
        spdlog::error("Timeout acquiring DB connection after {}ms. Pool size: {}, In-use: {}",
                      options_.acquire_timeout.count(), options_.size, in_use_);
        throw std::runtime_error("DB connection acquisition timeout");
    }
    if (shutdown_) {
        throw std::runtime_error("DB connection pool is shutting down");
    }

    std::unique_ptr<pqxx::connection> conn;
    if (!idle_.empty()) {
        conn = std::move(idle_.front());
        idle_.pop();
    } else {
        try {
            conn = std::make_unique<pqxx::connection>(conn_str_);
        } catch (const std::exception& e) {
            sectorscan::obs::LogFailure(sectorscan::obs::LogLevel::Error, "db_connect_failed", "db_pool",
                                        sectorscan::obs::kErrDbConnectFailed, e);
            cv_.notify_one();
            throw;
        }
    }

    in_use_++;
    total_acquires_++;

    auto wait_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    sectorscan::metrics::MetricsRegistry::Instance().SetGauge("db_pool_in_use", static_cast<double>(in_use_));
    sectorscan::metrics::MetricsRegistry::Instance().RecordLatency("db_pool_wait_time_ms", {}, wait_ms);
    if (wait_ms > 100.0) {
        spdlog::warn("DB connection acquisition took {}ms. Size={}, InUse={}, Idle={}",
                     wait_ms, options_.size, in_use_, idle_.size());
    }

    return DbConnectionPtr(conn.release(), [this](pqxx::connection* c) {
        this->ReleaseConnection(c);
    });
}

auto PooledDbConnectionManager::ReleaseConnection(pqxx::connection* conn) -> void {
    std::unique_ptr<pqxx::connection> owned(conn);
    std::lock_guard<std::mutex> lock(mutex_);
    in_use_--;

    if (shutdown_ || !owned || !owned->is_open()) {
        if (owned && !owned->is_open()) {
            spdlog::warn("Dropping closed/broken DB connection");
        }
        cv_.notify_one();
        return;
    }

    idle_.push(std::move(owned));
    cv_.notify_one();
}

auto PooledDbConnectionManager::GetStats() const -> PoolStats {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        options_.size,
        in_use_,
        idle_.size(),
        total_acquires_,
        total_timeouts_
    };
}
