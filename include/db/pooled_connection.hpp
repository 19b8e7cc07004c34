#pragma once

#include "db/idb_connection.hpp"
#include <atomic>
#include <functional>
#include <memory>

namespace querydesk {

/**
 * @brief RAII wrapper for database connection
 *
 * Automatically returns connection to pool on destruction.
 * Move-only to prevent accidental copying.
 *
 * An invalidated connection is closed and discarded instead of being
 * returned for reuse; the engine invalidates after cancel or timeout
 * because the session state is then unknown.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    /**
     * @brief Construct pooled connection with return callback
     * @param conn Database connection
     * @param return_fn Function to call on destruction (returns to pool)
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /// Mark the connection unfit for reuse. Thread-safe.
    void invalidate() noexcept { invalidated_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_invalidated() const noexcept {
        return invalidated_.load(std::memory_order_acquire);
    }

private:
    void release();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    std::atomic<bool> invalidated_{false};
};

} // namespace querydesk
