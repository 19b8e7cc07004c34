#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <mutex>
#include <string>

namespace querydesk {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 *
 * Bounded reads use single-row mode so at most max_rows rows are
 * materialized; the remainder of the result is drained and dropped.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, size_t max_rows = 0) override;
    DbResultSet execute_params(const std::string& sql, const std::vector<Cell>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void interrupt() override;
    void close() override;

    DatabaseType type() const override { return DatabaseType::POSTGRESQL; }
    std::string quote_identifier(std::string_view ident) const override;
    std::string placeholder(size_t n) const override;

private:
    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    static DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    static DbResultSet process_command_result(PGresult* res);

    DbResultSet execute_bounded(const std::string& sql, size_t max_rows);

    std::string last_error() const;

    PGconn* conn_;

    // Cancel handle is used from other threads; guarded against close()
    PGcancel* cancel_ = nullptr;
    std::mutex cancel_mutex_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb on a libpq conninfo string.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const std::string& connection_string) override;
};

} // namespace querydesk
