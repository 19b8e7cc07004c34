#pragma once

#include "core/database_type.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querydesk {

/// One result value; nullopt is SQL NULL
using Cell = std::optional<std::string>;
using Row = std::vector<Cell>;

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<Row> rows;

    // For DML/DDL
    uint64_t affected_rows = 0;

    // Row-returning statement vs DML/DDL
    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*, sqlite3*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 * The one exception is interrupt(), which may be called from any thread
 * while another thread is blocked in execute().
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL query or statement
     * @param sql SQL text (one statement)
     * @param max_rows Stop fetching after this many rows (0 = unlimited)
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql, size_t max_rows = 0) = 0;

    /**
     * @brief Execute a statement with bound text parameters
     * @param sql SQL text using placeholder(n) markers
     * @param params Parameter values; nullopt binds NULL
     */
    [[nodiscard]] virtual DbResultSet execute_params(const std::string& sql,
                                                     const std::vector<Cell>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set server-side query timeout for subsequent queries
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * PostgreSQL: SET statement_timeout = N
     * MySQL: SET SESSION max_execution_time = N
     * SQLite: busy timeout
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Best-effort interruption of an in-flight statement
     *
     * Thread-safe. Drivers without mid-statement interruption simply let the
     * statement run to completion.
     */
    virtual void interrupt() = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    /// Quote one identifier part in the dialect's style
    [[nodiscard]] virtual std::string quote_identifier(std::string_view ident) const = 0;

    /// Parameter marker for 1-based position n ($1 for PostgreSQL, ? elsewhere)
    [[nodiscard]] virtual std::string placeholder(size_t n) const = 0;

    // Transaction control. MySQL overrides begin() to use START TRANSACTION.
    [[nodiscard]] virtual DbResultSet begin() { return execute("BEGIN"); }
    [[nodiscard]] virtual DbResultSet commit() { return execute("COMMIT"); }
    [[nodiscard]] virtual DbResultSet rollback() { return execute("ROLLBACK"); }
};

} // namespace querydesk
