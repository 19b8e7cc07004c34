#include "executor/execution_engine.hpp"
#include "db/pooled_connection.hpp"
#include "parser/statement_splitter.hpp"
#include "registry/connection_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace querydesk {

namespace {

// Forced teardown: the session state is unknown from here on
void tear_down(PooledConnection& conn) {
    conn.invalidate();
    conn->interrupt();
}

std::string preview(const std::string& statement) {
    constexpr size_t kMax = 80;
    return statement.size() <= kMax ? statement : statement.substr(0, kMax) + "...";
}

} // namespace

ExecutionEngine::ExecutionEngine(Config config)
    : config_(config) {}

// ============================================================================
// Single statement
// ============================================================================

Result<ExecutionResult> ExecutionEngine::execute_statement(
    const std::shared_ptr<PooledConnection>& conn,
    const std::string& statement,
    size_t row_limit,
    const CancelToken& cancel) const {

    using R = Result<ExecutionResult>;

    // One extra row tells us whether the limit cut anything off
    const size_t max_rows = row_limit > 0 ? row_limit + 1 : 0;

    utils::Timer timer;
    auto task = std::make_shared<std::packaged_task<DbResultSet()>>(
        [conn, statement, max_rows] { return (*conn)->execute(statement, max_rows); });
    auto future = task->get_future();

    // The worker owns a reference to the connection; after a timeout it
    // keeps it alive until the driver call returns
    std::thread([task] { (*task)(); }).detach();

    const auto deadline = std::chrono::steady_clock::now() + config_.statement_timeout;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const auto wait = std::clamp(remaining, std::chrono::milliseconds{1}, config_.poll_interval);
        if (future.wait_for(wait) == std::future_status::ready) {
            break;
        }
        if (cancel.is_canceled()) {
            tear_down(*conn);
            utils::log::info(std::format("Canceled in-flight statement: {}", preview(statement)));
            return R::error(ErrorCategory::CANCELED, "Execution canceled", statement);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            tear_down(*conn);
            utils::log::warn(std::format("Statement timed out after {} ms: {}",
                config_.statement_timeout.count(), preview(statement)));
            return R::error(ErrorCategory::TIMEOUT,
                std::format("Execution timed out after {} seconds for statement: {}",
                    std::chrono::duration_cast<std::chrono::seconds>(config_.statement_timeout).count(),
                    statement),
                statement);
        }
    }

    DbResultSet rs;
    try {
        rs = future.get();
    } catch (const std::exception& e) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Error executing statement: {}\n{}", statement, e.what()), statement);
    }

    if (!rs.success) {
        return R::error(ErrorCategory::STATEMENT_ERROR,
            std::format("Error executing statement: {}\n{}", statement, rs.error_message), statement);
    }

    ExecutionResult result;
    result.statement = statement;
    if (rs.has_rows) {
        result.columns = std::move(rs.column_names);
        result.rows = std::move(rs.rows);
        if (row_limit > 0 && result.rows.size() > row_limit) {
            result.rows.resize(row_limit);
            result.truncated = true;
        }
    } else {
        result.columns = {"Message"};
        result.rows.push_back(Row{std::format("Affected rows: {}", rs.affected_rows)});
    }
    result.elapsed_seconds = timer.elapsed_seconds();
    return R::ok(std::move(result));
}

// ============================================================================
// Statement sequences
// ============================================================================

ExecutionEngine::RunResult ExecutionEngine::run(const std::shared_ptr<IConnectionPool>& pool,
                                                const std::string& sql_text,
                                                size_t row_limit,
                                                const CancelToken& cancel,
                                                const ResultCallback& on_result) const {
    const auto statements = StatementSplitter::split(sql_text);
    std::vector<ExecutionResult> results;
    if (statements.empty()) {
        return RunResult::ok(std::move(results));
    }
    if (!pool) {
        return RunResult::error(ErrorCategory::UNAVAILABLE, "No connection pool");
    }
    if (cancel.is_canceled()) {
        return RunResult::error(ErrorCategory::CANCELED, "Execution canceled", statements.front());
    }

    std::shared_ptr<PooledConnection> conn = pool->acquire(config_.acquire_timeout);
    if (!conn) {
        auto reason = pool->last_error();
        return RunResult::error(ErrorCategory::UNAVAILABLE,
            std::format("Connection '{}' is not available: {}", pool->name(),
                reason.empty() ? "no connection could be acquired" : reason));
    }

    // Server-side limit as a backstop to the client-side deadline
    if (config_.statement_timeout.count() > 0) {
        (*conn)->set_query_timeout(static_cast<uint32_t>(config_.statement_timeout.count()));
    }

    results.reserve(statements.size());
    for (const auto& statement : statements) {
        if (cancel.is_canceled()) {
            utils::log::info(std::format("Execution canceled before: {}", preview(statement)));
            return RunResult::error(ErrorCategory::CANCELED, "Execution canceled", statement);
        }

        auto executed = execute_statement(conn, statement, row_limit, cancel);
        if (executed.is_error()) {
            utils::log::debug(std::format("Statement failed on '{}': {}", pool->name(), executed.error_message()));
            return RunResult::error_from(executed);
        }

        utils::log::debug(std::format("Executed on '{}' in {:.3f}s ({} rows{}): {}",
            pool->name(), executed.value().elapsed_seconds, executed.value().rows.size(),
            executed.value().truncated ? ", truncated" : "", preview(statement)));

        if (on_result) {
            on_result(executed.value());
        }
        results.push_back(std::move(executed.value()));
    }
    return RunResult::ok(std::move(results));
}

ExecutionEngine::RunResult ExecutionEngine::run(IConnectionSource& source,
                                                const std::string& default_connection,
                                                const std::string& sql_text,
                                                size_t row_limit,
                                                const CancelToken& cancel,
                                                const ResultCallback& on_result) const {
    auto directive = StatementSplitter::extract_connection_directive(sql_text);
    const auto name = directive.connection_name.value_or(default_connection);
    if (name.empty()) {
        return RunResult::error(ErrorCategory::VALIDATION_ERROR, "No connection selected");
    }

    auto pool = source.get(name);
    if (pool.is_error()) {
        return RunResult::error_from(pool);
    }
    return run(pool.value(), directive.remaining_sql, row_limit, cancel, on_result);
}

std::future<ExecutionEngine::RunResult> ExecutionEngine::run_async(std::shared_ptr<IConnectionPool> pool,
                                                                   std::string sql_text,
                                                                   size_t row_limit,
                                                                   std::shared_ptr<CancelToken> cancel,
                                                                   ResultCallback on_result) const {
    if (!cancel) cancel = std::make_shared<CancelToken>();
    return std::async(std::launch::async,
        [engine = *this, pool = std::move(pool), sql = std::move(sql_text), row_limit,
         cancel = std::move(cancel), cb = std::move(on_result)] {
            return engine.run(pool, sql, row_limit, *cancel, cb);
        });
}

} // namespace querydesk
