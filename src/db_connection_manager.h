#pragma once

#include <pqxx/pqxx>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

/**
 * @brief Connection handle; the deleter hands the connection back to its manager.
 */
using DbConnectionPtr = std::unique_ptr<pqxx::connection, std::function<void(pqxx::connection*)>>;

/**
 * @brief Source of PostgreSQL connections for the detection store.
 */
class DbConnectionManager {
public:
    virtual ~DbConnectionManager() = default;

    virtual DbConnectionPtr GetConnection() = 0;

    virtual std::string GetConnectionString() const = 0;
};

/**
 * @brief Opens a fresh connection per request. Used by one-shot tools.
 */
class SimpleDbConnectionManager : public DbConnectionManager {
public:
    explicit SimpleDbConnectionManager(std::string conn_str) : conn_str_(std::move(conn_str)) {}

    DbConnectionPtr GetConnection() override {
        return DbConnectionPtr(new pqxx::connection(conn_str_),
                               [](pqxx::connection* c) { delete c; });
    }

    std::string GetConnectionString() const override { return conn_str_; }

private:
    std::string conn_str_;
};

struct PoolOptions {
    size_t size = 4;
    std::chrono::milliseconds acquire_timeout = std::chrono::seconds(5);
};

/**
 * @brief Bounded pool that reuses connections across the reads and writes of a scan.
 *
 * GetConnection blocks up to acquire_timeout for a free slot and throws
 * std::runtime_error when none frees up. Broken connections are dropped on release.
 */
class PooledDbConnectionManager : public DbConnectionManager {
public:
    PooledDbConnectionManager(std::string conn_str, PoolOptions options);
    ~PooledDbConnectionManager() override;

    DbConnectionPtr GetConnection() override;
    std::string GetConnectionString() const override { return conn_str_; }

    struct PoolStats {
        size_t size;
        size_t in_use;
        size_t available;
        long long total_acquires;
        long long total_timeouts;
    };
    PoolStats GetStats() const;

private:
    void ReleaseConnection(pqxx::connection* conn);

    std::string conn_str_;
    PoolOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<pqxx::connection>> idle_;
    size_t in_use_ = 0;
    long long total_acquires_ = 0;
    long long total_timeouts_ = 0;
    bool shutdown_ = false;
};
