#pragma once

#include "db/icatalog_reader.hpp"

namespace querydesk {

/**
 * @brief MySQL catalog reader (information_schema + SHOW CREATE TABLE)
 *
 * Unqualified names resolve against DATABASE().
 */
class MysqlCatalogReader : public ICatalogReader {
public:
    Result<std::vector<std::string>> table_names(IDbConnection& conn) override;
    Result<std::vector<std::string>> view_names(IDbConnection& conn) override;
    Result<std::vector<ColumnInfo>> columns(IDbConnection& conn, const std::string& table) override;
    Result<std::vector<std::string>> primary_key(IDbConnection& conn, const std::string& table) override;
    Result<std::vector<ForeignKeyInfo>> foreign_keys(IDbConnection& conn, const std::string& table) override;
    Result<std::vector<IndexInfo>> indexes(IDbConnection& conn, const std::string& table) override;
    Result<std::string> view_definition(IDbConnection& conn, const std::string& view) override;
    Result<std::string> native_create_statement(IDbConnection& conn, const std::string& table) override;

    /// No dump tool is used for MySQL; always NOT_FOUND
    Result<std::string> dump_create_statement(const std::string& target, const std::string& table,
                                              std::chrono::milliseconds timeout) override;
};

} // namespace querydesk
