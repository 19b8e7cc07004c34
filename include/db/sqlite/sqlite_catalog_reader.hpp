#pragma once

#include "db/icatalog_reader.hpp"

namespace querydesk {

/**
 * @brief SQLite catalog reader (sqlite_master and table-valued pragmas)
 *
 * A qualified name "aux.t" reads from the attached database "aux";
 * unqualified names read from "main".
 */
class SqliteCatalogReader : public ICatalogReader {
public:
    Result<std::vector<std::string>> table_names(IDbConnection& conn) override;
    Result<std::vector<std::string>> view_names(IDbConnection& conn) override;
    Result<std::vector<ColumnInfo>> columns(IDbConnection& conn, const std::string& table) override;
    Result<std::vector<std::string>> primary_key(IDbConnection& conn, const std::string& table) override;
    Result<std::vector<ForeignKeyInfo>> foreign_keys(IDbConnection& conn, const std::string& table) override;
    Result<std::vector<IndexInfo>> indexes(IDbConnection& conn, const std::string& table) override;
    Result<std::string> view_definition(IDbConnection& conn, const std::string& view) override;

    /// The CREATE TABLE text stored in sqlite_master
    Result<std::string> native_create_statement(IDbConnection& conn, const std::string& table) override;

    Result<std::string> dump_create_statement(const std::string& target, const std::string& table,
                                              std::chrono::milliseconds timeout) override;
};

} // namespace querydesk
