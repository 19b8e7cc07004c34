#pragma once

#include "db/icatalog_reader.hpp"

#include <string>

namespace querydesk {

/**
 * @brief PostgreSQL catalog reader
 *
 * Tables and views are listed from current_schema(), so the session
 * search_path decides what a connection "sees". Qualified names are
 * resolved through ::regclass.
 */
class PgCatalogReader : public ICatalogReader {
public:
    /// External dump tool, looked up on PATH
    explicit PgCatalogReader(std::string dump_tool = "pg_dump");

    Result<std::vector<std::string>> table_names(IDbConnection& conn) override;
    Result<std::vector<std::string>> view_names(IDbConnection& conn) override;
    Result<std::vector<ColumnInfo>> columns(IDbConnection& conn, const std::string& table) override;
    Result<std::vector<std::string>> primary_key(IDbConnection& conn, const std::string& table) override;
    Result<std::vector<ForeignKeyInfo>> foreign_keys(IDbConnection& conn, const std::string& table) override;
    Result<std::vector<IndexInfo>> indexes(IDbConnection& conn, const std::string& table) override;
    Result<std::string> view_definition(IDbConnection& conn, const std::string& view) override;

    /**
     * @brief CREATE TABLE assembled from pg_catalog
     *
     * Columns with format_type() types, defaults, identity markers and
     * NOT NULL; constraints via pg_get_constraintdef(); followed by the
     * table's index definitions from pg_indexes.
     */
    Result<std::string> native_create_statement(IDbConnection& conn, const std::string& table) override;

    /**
     * @brief Run pg_dump --schema-only against the pool's conninfo
     *
     * The password travels in PGPASSWORD, never on the command line.
     * With a table name, the first matching CREATE TABLE block is
     * extracted; if extraction fails the whole dump is returned.
     */
    Result<std::string> dump_create_statement(const std::string& target, const std::string& table,
                                              std::chrono::milliseconds timeout) override;

    /// First "CREATE TABLE ... <table> ... ;" block of a dump, or empty
    [[nodiscard]] static std::string extract_create_table(const std::string& dump, const std::string& table);

private:
    std::string dump_tool_;
};

} // namespace querydesk
