#include "db/sqlite/sqlite_catalog_reader.hpp"
#include "db/catalog_util.hpp"
#include <format>

namespace querydesk {

namespace {

struct Scope {
    std::string schema;
    std::string table;
};

Scope scope_of(const std::string& table) {
    auto [schema, name] = catalog::split_table(table);
    return {schema.value_or("main"), std::move(name)};
}

Result<DbResultSet> query(IDbConnection& conn, const std::string& sql, const std::vector<Cell>& params) {
    return catalog::checked(conn.execute_params(sql, params), sql);
}

Result<std::vector<std::string>> list_objects(IDbConnection& conn, std::string_view type) {
    static const std::string sql =
        "SELECT name FROM sqlite_master "
        "WHERE type = ? AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' ORDER BY name";
    auto rs = query(conn, sql, {std::string(type)});
    if (rs.is_error()) return Result<std::vector<std::string>>::error_from(rs);
    return Result<std::vector<std::string>>::ok(catalog::first_column(rs.value()));
}

Result<std::string> stored_sql(IDbConnection& conn, std::string_view type, const std::string& name) {
    const auto scope = scope_of(name);
    const std::string sql = std::format(
        "SELECT sql FROM {}.sqlite_master WHERE type = ? AND name = ?",
        conn.quote_identifier(scope.schema));
    auto rs = query(conn, sql, {std::string(type), scope.table});
    if (rs.is_error()) return Result<std::string>::error_from(rs);
    const auto found = catalog::first_column(rs.value());
    if (found.empty() || found[0].empty()) {
        return Result<std::string>::error(ErrorCategory::NOT_FOUND,
            std::format("No {} named '{}'", type, name));
    }
    return Result<std::string>::ok(found[0]);
}

} // namespace

Result<std::vector<std::string>> SqliteCatalogReader::table_names(IDbConnection& conn) {
    return list_objects(conn, "table");
}

Result<std::vector<std::string>> SqliteCatalogReader::view_names(IDbConnection& conn) {
    return list_objects(conn, "view");
}

Result<std::vector<ColumnInfo>> SqliteCatalogReader::columns(IDbConnection& conn, const std::string& table) {
    static const std::string sql =
        "SELECT name, type, \"notnull\", dflt_value FROM pragma_table_info(?, ?) ORDER BY cid";
    const auto scope = scope_of(table);
    auto rs = query(conn, sql, {scope.table, scope.schema});
    if (rs.is_error()) return Result<std::vector<ColumnInfo>>::error_from(rs);

    std::vector<ColumnInfo> cols;
    for (const auto& row : rs.value().rows) {
        ColumnInfo c;
        c.name = catalog::text(row[0]);
        c.type = catalog::text(row[1]);
        c.nullable = !catalog::truthy(row[2]);
        c.default_value = row[3];
        cols.push_back(std::move(c));
    }
    if (cols.empty()) {
        return Result<std::vector<ColumnInfo>>::error(ErrorCategory::NOT_FOUND,
            std::format("No such table: {}", table));
    }
    return Result<std::vector<ColumnInfo>>::ok(std::move(cols));
}

Result<std::vector<std::string>> SqliteCatalogReader::primary_key(IDbConnection& conn, const std::string& table) {
    static const std::string sql =
        "SELECT name FROM pragma_table_info(?, ?) WHERE pk > 0 ORDER BY pk";
    const auto scope = scope_of(table);
    auto rs = query(conn, sql, {scope.table, scope.schema});
    if (rs.is_error()) return Result<std::vector<std::string>>::error_from(rs);
    return Result<std::vector<std::string>>::ok(catalog::first_column(rs.value()));
}

Result<std::vector<ForeignKeyInfo>> SqliteCatalogReader::foreign_keys(IDbConnection& conn, const std::string& table) {
    static const std::string sql =
        "SELECT id, \"table\", \"from\", \"to\" FROM pragma_foreign_key_list(?, ?) ORDER BY id, seq";
    const auto scope = scope_of(table);
    auto rs = query(conn, sql, {scope.table, scope.schema});
    if (rs.is_error()) return Result<std::vector<ForeignKeyInfo>>::error_from(rs);

    // SQLite foreign keys are unnamed; rows are grouped by constraint id
    std::vector<ForeignKeyInfo> fks;
    std::string current_id;
    for (const auto& row : rs.value().rows) {
        const auto id = catalog::text(row[0]);
        if (fks.empty() || id != current_id) {
            current_id = id;
            ForeignKeyInfo fk;
            fk.referred_table = catalog::text(row[1]);
            fks.push_back(std::move(fk));
        }
        fks.back().columns.push_back(catalog::text(row[2]));
        // "to" is NULL when the reference targets the parent's primary key
        fks.back().referred_columns.push_back(catalog::text(row[3]));
    }
    return Result<std::vector<ForeignKeyInfo>>::ok(std::move(fks));
}

Result<std::vector<IndexInfo>> SqliteCatalogReader::indexes(IDbConnection& conn, const std::string& table) {
    static const std::string sql =
        "SELECT il.name, il.\"unique\", ii.name "
        "FROM pragma_index_list(?, ?) AS il, pragma_index_info(il.name, ?) AS ii "
        "WHERE il.origin <> 'pk' ORDER BY il.name, ii.seqno";
    const auto scope = scope_of(table);
    auto rs = query(conn, sql, {scope.table, scope.schema, scope.schema});
    if (rs.is_error()) return Result<std::vector<IndexInfo>>::error_from(rs);

    std::vector<IndexInfo> out;
    for (const auto& row : rs.value().rows) {
        const auto name = catalog::text(row[0]);
        if (out.empty() || out.back().name != name) {
            IndexInfo ix;
            ix.name = name;
            ix.unique = catalog::truthy(row[1]);
            out.push_back(std::move(ix));
        }
        out.back().columns.push_back(catalog::text(row[2]));
    }
    return Result<std::vector<IndexInfo>>::ok(std::move(out));
}

Result<std::string> SqliteCatalogReader::view_definition(IDbConnection& conn, const std::string& view) {
    return stored_sql(conn, "view", view);
}

Result<std::string> SqliteCatalogReader::native_create_statement(IDbConnection& conn, const std::string& table) {
    return stored_sql(conn, "table", table);
}

Result<std::string> SqliteCatalogReader::dump_create_statement(const std::string&, const std::string&,
                                                               std::chrono::milliseconds) {
    return Result<std::string>::error(ErrorCategory::NOT_FOUND, "No schema dump tool for SQLite");
}

} // namespace querydesk
