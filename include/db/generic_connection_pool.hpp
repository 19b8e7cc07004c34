#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace querydesk {

/**
 * @brief Database-agnostic connection pool
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Lazy initialization: connections created on-demand up to max
 * - Health checking: validates connections idle longer than idle_timeout
 * - Lifetime: connections older than max_lifetime are recycled on acquire
 * - Invalidation: connections marked invalid by the borrower are closed, not reused
 * - Session hook: PoolConfig::on_connect runs on every new physical connection
 * - RAII: PooledConnection auto-returns on destruction
 *
 * Handles may outlive the caller that acquired them (worker threads keep
 * them alive after a timeout), so the return path only holds a weak
 * reference to the pool. Create pools with std::make_shared.
 */
class GenericConnectionPool : public IConnectionPool,
                              public std::enable_shared_from_this<GenericConnectionPool> {
public:
    /**
     * @param db_name Connection name (for logging)
     * @param type Database kind served by this pool
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        DatabaseType type,
        PoolConfig config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }
    DatabaseType type() const override { return type_; }
    const std::string& target() const override { return config_.connection_string; }
    std::string last_error() const override;

private:
    /**
     * @brief Create new connection via factory and run the session hook
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    void discard(std::unique_ptr<IDbConnection> conn);

    std::string db_name_;
    DatabaseType type_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;
    std::string last_error_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> connections_invalidated_{0};

    std::atomic<bool> shutdown_{false};

    // Connection lifetime tracking
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
};

} // namespace querydesk
