#include "db/postgresql/pg_catalog_reader.hpp"
#include "db/catalog_util.hpp"
#include "core/subprocess.hpp"
#include "core/utils.hpp"
#include <libpq-fe.h>
#include <format>
#include <memory>
#include <regex>

namespace querydesk {

namespace {

// Unit separator; cannot appear in identifiers
constexpr char kListSep = '\x1f';

struct ConninfoDeleter {
    void operator()(PQconninfoOption* opts) const noexcept {
        if (opts) PQconninfoFree(opts);
    }
};
using ConninfoPtr = std::unique_ptr<PQconninfoOption, ConninfoDeleter>;

std::vector<std::string> split_list(const Cell& cell) {
    if (!cell || cell->empty()) return {};
    return utils::split(*cell, kListSep);
}

std::string conninfo_quote(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

std::string regex_escape(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (const char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

Result<DbResultSet> query(IDbConnection& conn, const std::string& sql, const std::vector<Cell>& params) {
    return catalog::checked(conn.execute_params(sql, params), sql);
}

} // namespace

PgCatalogReader::PgCatalogReader(std::string dump_tool)
    : dump_tool_(std::move(dump_tool)) {}

Result<std::vector<std::string>> PgCatalogReader::table_names(IDbConnection& conn) {
    static const std::string sql =
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema = current_schema() AND table_type = 'BASE TABLE' "
        "ORDER BY table_name";
    auto rs = query(conn, sql, {});
    if (rs.is_error()) return Result<std::vector<std::string>>::error_from(rs);
    return Result<std::vector<std::string>>::ok(catalog::first_column(rs.value()));
}

Result<std::vector<std::string>> PgCatalogReader::view_names(IDbConnection& conn) {
    static const std::string sql =
        "SELECT table_name FROM information_schema.views "
        "WHERE table_schema = current_schema() ORDER BY table_name";
    auto rs = query(conn, sql, {});
    if (rs.is_error()) return Result<std::vector<std::string>>::error_from(rs);
    return Result<std::vector<std::string>>::ok(catalog::first_column(rs.value()));
}

Result<std::vector<ColumnInfo>> PgCatalogReader::columns(IDbConnection& conn, const std::string& table) {
    static const std::string sql =
        "SELECT a.attname, format_type(a.atttypid, a.atttypmod), NOT a.attnotnull, "
        "       pg_get_expr(ad.adbin, ad.adrelid) "
        "FROM pg_attribute a "
        "LEFT JOIN pg_attrdef ad ON a.attrelid = ad.adrelid AND a.attnum = ad.adnum "
        "WHERE a.attrelid = $1::regclass AND a.attnum > 0 AND NOT a.attisdropped "
        "ORDER BY a.attnum";
    auto rs = query(conn, sql, {catalog::quote_qualified(conn, table)});
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

Result<std::vector<std::string>> PgCatalogReader::primary_key(IDbConnection& conn, const std::string& table) {
    static const std::string sql =
        "SELECT a.attname "
        "FROM pg_index i "
        "JOIN pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = ANY(i.indkey) "
        "WHERE i.indrelid = $1::regclass AND i.indisprimary "
        "ORDER BY array_position(i.indkey::int2[], a.attnum)";
    auto rs = query(conn, sql, {catalog::quote_qualified(conn, table)});
    if (rs.is_error()) return Result<std::vector<std::string>>::error_from(rs);
    return Result<std::vector<std::string>>::ok(catalog::first_column(rs.value()));
}

Result<std::vector<ForeignKeyInfo>> PgCatalogReader::foreign_keys(IDbConnection& conn, const std::string& table) {
    static const std::string sql =
        "SELECT c.conname, "
        "  (SELECT string_agg(a.attname, chr(31) ORDER BY k.ord) "
        "     FROM unnest(c.conkey) WITH ORDINALITY k(attnum, ord) "
        "     JOIN pg_attribute a ON a.attrelid = c.conrelid AND a.attnum = k.attnum), "
        "  c.confrelid::regclass::text, "
        "  (SELECT string_agg(a.attname, chr(31) ORDER BY k.ord) "
        "     FROM unnest(c.confkey) WITH ORDINALITY k(attnum, ord) "
        "     JOIN pg_attribute a ON a.attrelid = c.confrelid AND a.attnum = k.attnum) "
        "FROM pg_constraint c "
        "WHERE c.conrelid = $1::regclass AND c.contype = 'f' "
        "ORDER BY c.conname";
    auto rs = query(conn, sql, {catalog::quote_qualified(conn, table)});
    if (rs.is_error()) return Result<std::vector<ForeignKeyInfo>>::error_from(rs);

    std::vector<ForeignKeyInfo> fks;
    for (const auto& row : rs.value().rows) {
        ForeignKeyInfo fk;
        fk.name = catalog::text(row[0]);
        fk.columns = split_list(row[1]);
        fk.referred_table = catalog::text(row[2]);
        fk.referred_columns = split_list(row[3]);
        fks.push_back(std::move(fk));
    }
    return Result<std::vector<ForeignKeyInfo>>::ok(std::move(fks));
}

Result<std::vector<IndexInfo>> PgCatalogReader::indexes(IDbConnection& conn, const std::string& table) {
    static const std::string sql =
        "SELECT ic.relname, i.indisunique, "
        "  (SELECT string_agg(a.attname, chr(31) ORDER BY k.ord) "
        "     FROM unnest(i.indkey::int2[]) WITH ORDINALITY k(attnum, ord) "
        "     JOIN pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = k.attnum) "
        "FROM pg_index i "
        "JOIN pg_class ic ON ic.oid = i.indexrelid "
        "WHERE i.indrelid = $1::regclass AND NOT i.indisprimary "
        "ORDER BY ic.relname";
    auto rs = query(conn, sql, {catalog::quote_qualified(conn, table)});
    if (rs.is_error()) return Result<std::vector<IndexInfo>>::error_from(rs);

    std::vector<IndexInfo> out;
    for (const auto& row : rs.value().rows) {
        IndexInfo ix;
        ix.name = catalog::text(row[0]);
        ix.unique = catalog::truthy(row[1]);
        ix.columns = split_list(row[2]);
        out.push_back(std::move(ix));
    }
    return Result<std::vector<IndexInfo>>::ok(std::move(out));
}

Result<std::string> PgCatalogReader::view_definition(IDbConnection& conn, const std::string& view) {
    static const std::string sql = "SELECT pg_get_viewdef($1::regclass, true)";
    auto rs = query(conn, sql, {catalog::quote_qualified(conn, view)});
    if (rs.is_error()) return Result<std::string>::error_from(rs);
    const auto defs = catalog::first_column(rs.value());
    if (defs.empty() || utils::trim(defs[0]).empty()) {
        return Result<std::string>::error(ErrorCategory::NOT_FOUND,
            std::format("No definition for view '{}'", view));
    }
    return Result<std::string>::ok(utils::trim(defs[0]));
}

Result<std::string> PgCatalogReader::native_create_statement(IDbConnection& conn, const std::string& table) {
    static const std::string rel_sql =
        "SELECT n.nspname, c.relname, c.oid::text "
        "FROM pg_class c JOIN pg_namespace n ON c.relnamespace = n.oid "
        "WHERE c.oid = $1::regclass AND c.relkind IN ('r', 'p')";
    auto rel = query(conn, rel_sql, {catalog::quote_qualified(conn, table)});
    if (rel.is_error()) return Result<std::string>::error_from(rel);
    if (rel.value().rows.empty()) {
        return Result<std::string>::error(ErrorCategory::NOT_FOUND,
            std::format("'{}' is not a table", table));
    }
    const auto& r = rel.value().rows[0];
    const std::string schema = catalog::text(r[0]);
    const std::string relname = catalog::text(r[1]);
    const std::string oid = catalog::text(r[2]);

    static const std::string col_sql =
        "SELECT a.attname, format_type(a.atttypid, a.atttypmod), a.attnotnull, "
        "       pg_get_expr(ad.adbin, ad.adrelid), a.attidentity "
        "FROM pg_attribute a "
        "LEFT JOIN pg_attrdef ad ON a.attrelid = ad.adrelid AND a.attnum = ad.adnum "
        "WHERE a.attrelid = $1::oid AND a.attnum > 0 AND NOT a.attisdropped "
        "ORDER BY a.attnum";
    static const std::string con_sql =
        "SELECT conname, contype, pg_get_constraintdef(c.oid) "
        "FROM pg_constraint c "
        "WHERE c.conrelid = $1::oid AND contype IN ('p', 'f', 'u', 'c') "
        "ORDER BY contype, conname";
    static const std::string idx_sql =
        "SELECT indexdef FROM pg_indexes WHERE schemaname = $1 AND tablename = $2";

    auto cols = query(conn, col_sql, {oid});
    if (cols.is_error()) return Result<std::string>::error_from(cols);
    auto cons = query(conn, con_sql, {oid});
    if (cons.is_error()) return Result<std::string>::error_from(cons);
    auto idxs = query(conn, idx_sql, {schema, relname});
    if (idxs.is_error()) return Result<std::string>::error_from(idxs);

    std::vector<std::string> defs;
    for (const auto& row : cols.value().rows) {
        std::string line = std::format("{} {}", conn.quote_identifier(catalog::text(row[0])),
                                       catalog::text(row[1]));
        // attidentity: '' none, 'a' always, 'd' by default
        const auto identity = catalog::text(row[4]);
        if (identity == "a") {
            line += " GENERATED ALWAYS AS IDENTITY";
        } else if (identity == "d") {
            line += " GENERATED BY DEFAULT AS IDENTITY";
        }
        if (row[3]) line += " DEFAULT " + *row[3];
        if (catalog::truthy(row[2])) line += " NOT NULL";
        defs.push_back(std::move(line));
    }
    for (const auto& row : cons.value().rows) {
        if (row[2] && !row[2]->empty()) defs.push_back(*row[2]);
    }
    if (defs.empty()) {
        return Result<std::string>::error(ErrorCategory::NOT_FOUND,
            std::format("No columns found for '{}'", table));
    }

    std::string ddl = std::format("CREATE TABLE {}.{} (\n  ",
        conn.quote_identifier(schema), conn.quote_identifier(relname));
    for (size_t i = 0; i < defs.size(); ++i) {
        if (i > 0) ddl += ",\n  ";
        ddl += defs[i];
    }
    ddl += "\n);";

    // pg_indexes includes the primary key index as well
    for (const auto& def : catalog::first_column(idxs.value())) {
        ddl += "\n\n" + def + ";";
    }
    return Result<std::string>::ok(std::move(ddl));
}

Result<std::string> PgCatalogReader::dump_create_statement(const std::string& target, const std::string& table,
                                                          std::chrono::milliseconds timeout) {
    char* err = nullptr;
    ConninfoPtr opts(PQconninfoParse(target.c_str(), &err));
    if (!opts) {
        std::string message = err ? err : "invalid conninfo";
        if (err) PQfreemem(err);
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, utils::trim(message));
    }

    std::string conninfo;
    std::vector<std::string> env;
    for (const PQconninfoOption* o = opts.get(); o->keyword; ++o) {
        if (!o->val || !*o->val) continue;
        const std::string keyword = o->keyword;
        if (keyword == "password") {
            env.push_back(std::string("PGPASSWORD=") + o->val);
            continue;
        }
        if (!conninfo.empty()) conninfo += ' ';
        conninfo += keyword + "=" + conninfo_quote(o->val);
    }

    std::vector<std::string> argv = {dump_tool_, "--schema-only", "--no-owner", "--no-privileges"};
    if (!table.empty()) {
        argv.push_back("--table");
        argv.push_back(table);
    }
    argv.push_back("--dbname=" + conninfo);

    auto run = utils::run_process(argv, env, timeout);
    if (run.is_error()) return Result<std::string>::error_from(run);
    if (run.value().exit_code != 0) {
        return Result<std::string>::error(ErrorCategory::UNAVAILABLE,
            std::format("{} exited with code {}", dump_tool_, run.value().exit_code));
    }

    const auto& dump = run.value().stdout_text;
    if (table.empty()) return Result<std::string>::ok(dump);

    auto block = extract_create_table(dump, table);
    return Result<std::string>::ok(block.empty() ? dump : std::move(block));
}

std::string PgCatalogReader::extract_create_table(const std::string& dump, const std::string& table) {
    const auto name = catalog::split_table(table).second;
    const std::regex pattern(
        "CREATE TABLE[\\s\\S]*?\\b" + regex_escape(name) + "\\b[\\s\\S]*?;",
        std::regex::icase);
    std::smatch m;
    if (std::regex_search(dump, m, pattern)) {
        return m.str(0);
    }
    return {};
}

} // namespace querydesk
