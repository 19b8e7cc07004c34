#include "db/mysql/mysql_catalog_reader.hpp"
#include "db/catalog_util.hpp"
#include <format>

namespace querydesk {

namespace {

// Schema filter shared by every per-table query: explicit schema or DATABASE()
constexpr const char* kScopeFilter = "TABLE_SCHEMA = COALESCE(?, DATABASE()) AND TABLE_NAME = ?";

std::vector<Cell> scope_params(const std::string& table) {
    auto [schema, name] = catalog::split_table(table);
    return {std::move(schema), std::move(name)};
}

Result<DbResultSet> query(IDbConnection& conn, const std::string& sql, const std::vector<Cell>& params) {
    return catalog::checked(conn.execute_params(sql, params), sql);
}

Result<std::vector<std::string>> list_tables(IDbConnection& conn, std::string_view table_type) {
    static const std::string sql =
        "SELECT TABLE_NAME FROM information_schema.TABLES "
        "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_TYPE = ? ORDER BY TABLE_NAME";
    auto rs = query(conn, sql, {std::string(table_type)});
    if (rs.is_error()) return Result<std::vector<std::string>>::error_from(rs);
    return Result<std::vector<std::string>>::ok(catalog::first_column(rs.value()));
}

} // namespace

Result<std::vector<std::string>> MysqlCatalogReader::table_names(IDbConnection& conn) {
    return list_tables(conn, "BASE TABLE");
}

Result<std::vector<std::string>> MysqlCatalogReader::view_names(IDbConnection& conn) {
    return list_tables(conn, "VIEW");
}

Result<std::vector<ColumnInfo>> MysqlCatalogReader::columns(IDbConnection& conn, const std::string& table) {
    const std::string sql = std::format(
        "SELECT COLUMN_NAME, COLUMN_TYPE, IS_NULLABLE, COLUMN_DEFAULT "
        "FROM information_schema.COLUMNS WHERE {} ORDER BY ORDINAL_POSITION", kScopeFilter);
    auto rs = query(conn, sql, scope_params(table));
    if (rs.is_error()) return Result<std::vector<ColumnInfo>>::error_from(rs);

    std::vector<ColumnInfo> cols;
    for (const auto& row : rs.value().rows) {
        ColumnInfo c;
        c.name = catalog::text(row[0]);
        c.type = catalog::text(row[1]);
        c.nullable = catalog::truthy(row[2]);
        c.default_value = row[3];
        cols.push_back(std::move(c));
    }
    return Result<std::vector<ColumnInfo>>::ok(std::move(cols));
}

Result<std::vector<std::string>> MysqlCatalogReader::primary_key(IDbConnection& conn, const std::string& table) {
    const std::string sql = std::format(
        "SELECT COLUMN_NAME FROM information_schema.KEY_COLUMN_USAGE "
        "WHERE {} AND CONSTRAINT_NAME = 'PRIMARY' ORDER BY ORDINAL_POSITION", kScopeFilter);
    auto rs = query(conn, sql, scope_params(table));
    if (rs.is_error()) return Result<std::vector<std::string>>::error_from(rs);
    return Result<std::vector<std::string>>::ok(catalog::first_column(rs.value()));
}

Result<std::vector<ForeignKeyInfo>> MysqlCatalogReader::foreign_keys(IDbConnection& conn, const std::string& table) {
    const std::string sql = std::format(
        "SELECT CONSTRAINT_NAME, COLUMN_NAME, REFERENCED_TABLE_NAME, REFERENCED_COLUMN_NAME "
        "FROM information_schema.KEY_COLUMN_USAGE "
        "WHERE {} AND REFERENCED_TABLE_NAME IS NOT NULL "
        "ORDER BY CONSTRAINT_NAME, ORDINAL_POSITION", kScopeFilter);
    auto rs = query(conn, sql, scope_params(table));
    if (rs.is_error()) return Result<std::vector<ForeignKeyInfo>>::error_from(rs);

    std::vector<ForeignKeyInfo> fks;
    for (const auto& row : rs.value().rows) {
        const auto name = catalog::text(row[0]);
        if (fks.empty() || fks.back().name != name) {
            ForeignKeyInfo fk;
            fk.name = name;
            fk.referred_table = catalog::text(row[2]);
            fks.push_back(std::move(fk));
        }
        fks.back().columns.push_back(catalog::text(row[1]));
        fks.back().referred_columns.push_back(catalog::text(row[3]));
    }
    return Result<std::vector<ForeignKeyInfo>>::ok(std::move(fks));
}

Result<std::vector<IndexInfo>> MysqlCatalogReader::indexes(IDbConnection& conn, const std::string& table) {
    const std::string sql = std::format(
        "SELECT INDEX_NAME, NON_UNIQUE, COLUMN_NAME FROM information_schema.STATISTICS "
        "WHERE {} AND INDEX_NAME <> 'PRIMARY' ORDER BY INDEX_NAME, SEQ_IN_INDEX", kScopeFilter);
    auto rs = query(conn, sql, scope_params(table));
    if (rs.is_error()) return Result<std::vector<IndexInfo>>::error_from(rs);

    std::vector<IndexInfo> out;
    for (const auto& row : rs.value().rows) {
        const auto name = catalog::text(row[0]);
        if (out.empty() || out.back().name != name) {
            IndexInfo ix;
            ix.name = name;
            ix.unique = !catalog::truthy(row[1]);
            out.push_back(std::move(ix));
        }
        out.back().columns.push_back(catalog::text(row[2]));
    }
    return Result<std::vector<IndexInfo>>::ok(std::move(out));
}

Result<std::string> MysqlCatalogReader::view_definition(IDbConnection& conn, const std::string& view) {
    const std::string sql = std::format(
        "SELECT VIEW_DEFINITION FROM information_schema.VIEWS WHERE {}", kScopeFilter);
    auto rs = query(conn, sql, scope_params(view));
    if (rs.is_error()) return Result<std::string>::error_from(rs);
    const auto defs = catalog::first_column(rs.value());
    if (defs.empty() || defs[0].empty()) {
        return Result<std::string>::error(ErrorCategory::NOT_FOUND,
            std::format("No definition for view '{}'", view));
    }
    return Result<std::string>::ok(defs[0]);
}

Result<std::string> MysqlCatalogReader::native_create_statement(IDbConnection& conn, const std::string& table) {
    const std::string sql = "SHOW CREATE TABLE " + catalog::quote_qualified(conn, table);
    auto rs = catalog::checked(conn.execute(sql), sql);
    if (rs.is_error()) return Result<std::string>::error_from(rs);
    const auto& rows = rs.value().rows;
    if (rows.empty() || rows[0].size() < 2 || !rows[0][1]) {
        return Result<std::string>::error(ErrorCategory::NOT_FOUND,
            std::format("SHOW CREATE TABLE returned nothing for '{}'", table));
    }
    return Result<std::string>::ok(*rows[0][1]);
}

Result<std::string> MysqlCatalogReader::dump_create_statement(const std::string&, const std::string&,
                                                             std::chrono::milliseconds) {
    return Result<std::string>::error(ErrorCategory::NOT_FOUND, "No schema dump tool for MySQL");
}

} // namespace querydesk
