#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace querydesk {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    DatabaseType type,
    PoolConfig config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      type_(type),
      config_(std::move(config)),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config_.max_connections)) {

    // Pre-warm pool with min_connections (0 by default: handles are lazy)
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            const auto now = std::chrono::steady_clock::now();
            created_at_[conn.get()] = now;
            last_used_[conn.get()] = now;
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for '{}'",
                i + 1, db_name_));
        }
    }

    utils::log::debug(std::format("ConnectionPool created for '{}' ({}): min={}, max={}",
        db_name_, database_type_to_string(type_), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard lock(mutex_);
        last_error_ = std::format("timed out after {} ms waiting for a free connection", timeout.count());
        return nullptr;
    }

    // Re-check shutdown after acquiring semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point birth{};
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (conn) {
                const auto it = created_at_.find(conn.get());
                if (it != created_at_.end()) birth = it->second;
                const auto lu = last_used_.find(conn.get());
                if (lu != last_used_.end()) last_used = lu->second;
            }
        }
    }

    const auto replace = [this](std::unique_ptr<IDbConnection>& c) {
        {
            std::lock_guard lock(mutex_);
            created_at_.erase(c.get());
            last_used_.erase(c.get());
        }
        c->close();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
        c = create_connection();
    };

    if (!conn) {
        conn = create_connection();
    } else if (config_.max_lifetime.count() > 0 &&
               std::chrono::steady_clock::now() - birth > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        replace(conn);
    } else if (std::chrono::steady_clock::now() - last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        // Only connections idle past idle_timeout pay for a health round trip
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        replace(conn);
    }

    if (!conn) {
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        created_at_.try_emplace(conn.get(), now);
        last_used_[conn.get()] = now;
    }

    std::weak_ptr<GenericConnectionPool> weak = weak_from_this();
    auto return_fn = [weak](std::unique_ptr<IDbConnection> c, bool reusable) {
        if (auto pool = weak.lock()) {
            pool->return_connection(std::move(c), reusable);
        } else if (c) {
            c->close();
        }
    };

    return std::make_unique<PooledConnection>(std::move(conn), std::move(return_fn));
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.connections_invalidated = connections_invalidated_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();
    created_at_.clear();
    last_used_.clear();

    utils::log::debug(std::format("ConnectionPool drained for '{}'", db_name_));
}

std::string GenericConnectionPool::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto created = factory_->create(config_.connection_string);
    if (created.is_error()) {
        std::lock_guard lock(mutex_);
        last_error_ = created.error_message();
        return nullptr;
    }

    auto conn = std::move(created.value());
    total_connections_.fetch_add(1, std::memory_order_relaxed);

    if (config_.on_connect) {
        try {
            config_.on_connect(*conn);
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Session initialization failed for '{}': {}", db_name_, e.what()));
        }
    }
    return conn;
}

void GenericConnectionPool::discard(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (!reusable) {
        connections_invalidated_.fetch_add(1, std::memory_order_relaxed);
        discard(std::move(conn));
        semaphore_.release();
        return;
    }

    if (shutdown_.load(std::memory_order_acquire)) {
        discard(std::move(conn));
        semaphore_.release();
        return;
    }

    // No health check on return; stale connections are caught on the next
    // acquire via the idle_timeout check
    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace querydesk
