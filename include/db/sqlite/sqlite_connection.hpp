#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <mutex>
#include <string>

namespace querydesk {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* opened in serialized (FULLMUTEX) mode so interrupt()
 * can be issued from another thread. A text containing several
 * statements runs them in order and reports the last one.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open handle (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql, size_t max_rows = 0) override;
    DbResultSet execute_params(const std::string& sql, const std::vector<Cell>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;

    /// Maps to sqlite3_busy_timeout; SQLite has no statement deadline
    bool set_query_timeout(uint32_t timeout_ms) override;
    void interrupt() override;
    void close() override;

    DatabaseType type() const override { return DatabaseType::SQLITE; }
    std::string quote_identifier(std::string_view ident) const override;
    std::string placeholder(size_t n) const override;

private:
    DbResultSet run_statement(sqlite3_stmt* stmt, size_t max_rows);

    sqlite3* db_;

    // interrupt() races close() from other threads
    mutable std::mutex handle_mutex_;
};

/**
 * @brief SQLite connection factory
 *
 * The connection string is the database file path. Files are never
 * created: a missing path is NOT_FOUND.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const std::string& connection_string) override;
};

} // namespace querydesk
