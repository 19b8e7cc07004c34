#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/idb_connection.hpp"
#include "parser/statement_splitter.hpp"

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace querydesk::catalog {

/// Turn a driver failure into a STATEMENT_ERROR carrying the query text
[[nodiscard]] inline Result<DbResultSet> checked(DbResultSet rs, std::string_view sql) {
    if (!rs.success) {
        return Result<DbResultSet>::error(ErrorCategory::STATEMENT_ERROR,
            std::move(rs.error_message), std::string(sql));
    }
    return Result<DbResultSet>::ok(std::move(rs));
}

[[nodiscard]] inline std::string text(const Cell& cell, std::string fallback = {}) {
    return cell ? *cell : std::move(fallback);
}

/// Boolean catalog values across dialects: t/true/1/YES
[[nodiscard]] inline bool truthy(const Cell& cell) {
    if (!cell) return false;
    const auto v = utils::to_lower(*cell);
    return v == "t" || v == "true" || v == "1" || v == "yes";
}

/// First column of every row
[[nodiscard]] inline std::vector<std::string> first_column(const DbResultSet& rs) {
    std::vector<std::string> out;
    out.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (!row.empty() && row[0]) out.push_back(*row[0]);
    }
    return out;
}

/// "schema.table" -> {schema, table}; unqualified -> {nullopt, table}
[[nodiscard]] inline std::pair<std::optional<std::string>, std::string> split_table(std::string_view name) {
    auto parts = StatementSplitter::split_qualified_name(name);
    if (parts.size() >= 2) {
        auto table = std::move(parts.back());
        parts.pop_back();
        std::string schema = parts[0];
        for (size_t i = 1; i < parts.size(); ++i) schema += "." + parts[i];
        return {std::move(schema), std::move(table)};
    }
    return {std::nullopt, parts.empty() ? std::string(name) : parts[0]};
}

/// Quote every part of a possibly qualified name with the connection's dialect
[[nodiscard]] inline std::string quote_qualified(const IDbConnection& conn, std::string_view name) {
    std::string out;
    for (const auto& part : StatementSplitter::split_qualified_name(name)) {
        if (!out.empty()) out += '.';
        out += conn.quote_identifier(part);
    }
    return out;
}

} // namespace querydesk::catalog
