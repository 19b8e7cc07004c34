#pragma once

#include "core/database_type.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace querydesk {

// Forward declarations
class IDbConnection;
class PooledConnection;

/**
 * @brief Pool configuration (database-agnostic)
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 0;
    size_t max_connections = 4;
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled

    /// Session initialization run on every new physical connection
    std::function<void(IDbConnection&)> on_connect;
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
    size_t connections_invalidated = 0;
};

/**
 * @brief Abstract connection pool interface
 *
 * One pool backs each live registry entry. Physical connections are
 * created on demand up to max_connections.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire connection from pool (blocking with timeout)
     * @param timeout Max wait time for acquisition
     * @return RAII connection handle or nullptr on timeout/error
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Drain pool - close all idle connections
     */
    virtual void drain() = 0;

    /**
     * @brief Connection name this pool serves
     */
    [[nodiscard]] virtual const std::string& name() const = 0;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    /// Connection target the pool opens physical connections with
    [[nodiscard]] virtual const std::string& target() const = 0;

    /// Message of the most recent failed connect attempt (empty if none)
    [[nodiscard]] virtual std::string last_error() const = 0;
};

} // namespace querydesk
