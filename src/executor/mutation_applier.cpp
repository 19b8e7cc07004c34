#include "executor/mutation_applier.hpp"
#include "db/catalog_util.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"

#include <format>
#include <functional>

namespace querydesk {

namespace {

std::string where_clause(const IDbConnection& conn, const ColumnValues& key, std::vector<Cell>& params) {
    std::string out;
    for (const auto& [column, value] : key) {
        if (!out.empty()) out += " AND ";
        out += conn.quote_identifier(column);
        if (!value) {
            out += " IS NULL";
            continue;
        }
        params.push_back(value);
        out += " = " + conn.placeholder(params.size());
    }
    return out;
}

/// Run body between BEGIN and COMMIT; ROLLBACK on any failure
Result<uint64_t> in_transaction(PooledConnection& conn, const std::function<Result<uint64_t>()>& body) {
    using R = Result<uint64_t>;

    const auto begin = conn->begin();
    if (!begin.success) {
        return R::error(ErrorCategory::STATEMENT_ERROR,
            std::format("Could not start transaction: {}", begin.error_message));
    }

    auto outcome = body();
    if (outcome.is_ok()) {
        const auto commit = conn->commit();
        if (commit.success) return outcome;
        outcome = R::error(ErrorCategory::STATEMENT_ERROR,
            std::format("Commit failed: {}", commit.error_message));
    }

    const auto rollback = conn->rollback();
    if (!rollback.success) {
        // Transaction state unknown; keep the connection out of the pool
        conn.invalidate();
        utils::log::warn(std::format("Rollback failed: {}", rollback.error_message));
    }
    return outcome;
}

} // namespace

MutationApplier::MutationApplier(std::chrono::milliseconds acquire_timeout)
    : acquire_timeout_(acquire_timeout) {}

std::string MutationApplier::build_update(const IDbConnection& conn, const std::string& table,
                                          const PendingEdit& edit, std::vector<Cell>& params) {
    std::string sets;
    for (const auto& [column, value] : edit.changes) {
        if (!sets.empty()) sets += ", ";
        params.push_back(value);
        sets += conn.quote_identifier(column) + " = " + conn.placeholder(params.size());
    }
    return std::format("UPDATE {} SET {} WHERE {}",
        catalog::quote_qualified(conn, table), sets, where_clause(conn, edit.primary_key, params));
}

std::string MutationApplier::build_delete(const IDbConnection& conn, const std::string& table,
                                          const ColumnValues& primary_key, std::vector<Cell>& params) {
    return std::format("DELETE FROM {} WHERE {}",
        catalog::quote_qualified(conn, table), where_clause(conn, primary_key, params));
}

Result<uint64_t> MutationApplier::apply_updates(IConnectionPool& pool,
                                                const std::string& table,
                                                const std::vector<PendingEdit>& edits) const {
    using R = Result<uint64_t>;

    std::vector<const PendingEdit*> applicable;
    for (const auto& edit : edits) {
        if (!edit.changes.empty() && !edit.primary_key.empty()) applicable.push_back(&edit);
    }
    if (applicable.empty()) {
        return R::ok(0);
    }

    auto conn = pool.acquire(acquire_timeout_);
    if (!conn) {
        return R::error(ErrorCategory::UNAVAILABLE,
            std::format("Connection '{}' is not available: {}", pool.name(), pool.last_error()));
    }

    auto result = in_transaction(*conn, [&]() -> R {
        uint64_t total = 0;
        for (const auto* edit : applicable) {
            std::vector<Cell> params;
            const auto sql = build_update(*(*conn).get(), table, *edit, params);
            const auto rs = (*conn)->execute_params(sql, params);
            if (!rs.success) {
                return R::error(ErrorCategory::STATEMENT_ERROR,
                    std::format("Error executing statement: {}\n{}", sql, rs.error_message), sql);
            }
            total += rs.affected_rows;
        }
        return R::ok(total);
    });

    if (result.is_ok()) {
        utils::log::info(std::format("Applied {} edit(s) to {} on '{}': {} row(s) affected",
            applicable.size(), table, pool.name(), result.value()));
    }
    return result;
}

Result<uint64_t> MutationApplier::delete_row(IConnectionPool& pool,
                                             const std::string& table,
                                             const ColumnValues& primary_key) const {
    using R = Result<uint64_t>;

    if (primary_key.empty()) {
        return R::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Cannot delete from {}: row has no primary key values", table));
    }

    auto conn = pool.acquire(acquire_timeout_);
    if (!conn) {
        return R::error(ErrorCategory::UNAVAILABLE,
            std::format("Connection '{}' is not available: {}", pool.name(), pool.last_error()));
    }

    return in_transaction(*conn, [&]() -> R {
        std::vector<Cell> params;
        const auto sql = build_delete(*(*conn).get(), table, primary_key, params);
        const auto rs = (*conn)->execute_params(sql, params);
        if (!rs.success) {
            return R::error(ErrorCategory::STATEMENT_ERROR,
                std::format("Error executing statement: {}\n{}", sql, rs.error_message), sql);
        }
        return R::ok(rs.affected_rows);
    });
}

} // namespace querydesk
