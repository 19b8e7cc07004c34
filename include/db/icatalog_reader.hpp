#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace querydesk {

struct ColumnInfo {
    std::string name;
    std::string type;
    bool nullable = true;
    std::optional<std::string> default_value;
};

struct ForeignKeyInfo {
    std::string name;
    std::vector<std::string> columns;
    std::string referred_table;
    std::vector<std::string> referred_columns;
};

struct IndexInfo {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
};

/**
 * @brief Abstract catalog reader
 *
 * Each backend queries its own catalog (pg_catalog + information_schema for
 * PG, information_schema for MySQL, sqlite_master and pragmas for SQLite).
 * Table names may be schema-qualified ("schema.table"); unqualified names
 * resolve against the session's current schema.
 */
class ICatalogReader {
public:
    virtual ~ICatalogReader() = default;

    [[nodiscard]] virtual Result<std::vector<std::string>> table_names(IDbConnection& conn) = 0;
    [[nodiscard]] virtual Result<std::vector<std::string>> view_names(IDbConnection& conn) = 0;

    [[nodiscard]] virtual Result<std::vector<ColumnInfo>> columns(
        IDbConnection& conn, const std::string& table) = 0;
    [[nodiscard]] virtual Result<std::vector<std::string>> primary_key(
        IDbConnection& conn, const std::string& table) = 0;
    [[nodiscard]] virtual Result<std::vector<ForeignKeyInfo>> foreign_keys(
        IDbConnection& conn, const std::string& table) = 0;
    [[nodiscard]] virtual Result<std::vector<IndexInfo>> indexes(
        IDbConnection& conn, const std::string& table) = 0;

    [[nodiscard]] virtual Result<std::string> view_definition(
        IDbConnection& conn, const std::string& view) = 0;

    /**
     * @brief DDL from the dialect's own facilities
     *
     * sqlite_master.sql, SHOW CREATE TABLE, or DDL assembled from pg_catalog.
     */
    [[nodiscard]] virtual Result<std::string> native_create_statement(
        IDbConnection& conn, const std::string& table) = 0;

    /**
     * @brief DDL from an external dump tool
     * @param target Connection target of the pool
     * @param table Table to dump, or empty for the whole schema
     *
     * Backends without a dump tool return NOT_FOUND.
     */
    [[nodiscard]] virtual Result<std::string> dump_create_statement(
        const std::string& target, const std::string& table,
        std::chrono::milliseconds timeout) = 0;
};

} // namespace querydesk
