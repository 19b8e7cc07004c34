#include "db/pooled_connection.hpp"

namespace querydesk {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn)
    : conn_(std::move(conn)), return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::move(other.conn_)),
      return_fn_(std::move(other.return_fn_)),
      invalidated_(other.invalidated_.load()) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        // Return current connection before taking new one
        release();
        conn_ = std::move(other.conn_);
        return_fn_ = std::move(other.return_fn_);
        invalidated_.store(other.invalidated_.load());
    }
    return *this;
}

void PooledConnection::release() {
    if (!conn_) return;
    const bool reusable = !is_invalidated();
    if (return_fn_) {
        return_fn_(std::move(conn_), reusable);
    } else {
        conn_->close();
        conn_.reset();
    }
}

} // namespace querydesk
