#pragma once

#include "core/cancel_token.hpp"
#include "core/error.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace querydesk {

class IConnectionSource;
class PooledConnection;

/**
 * @brief Outcome of one successfully executed statement
 *
 * Statements without a row set report columns {"Message"} and a single
 * row "Affected rows: N".
 */
struct ExecutionResult {
    std::string statement;
    std::vector<std::string> columns;
    std::vector<Row> rows;
    double elapsed_seconds = 0.0;
    bool truncated = false;   // more rows existed than row_limit
};

/**
 * @brief Runs multi-statement SQL text against one pooled connection
 *
 * Statements run strictly in order on a single physical connection, so
 * session state (SET, temp tables) carries across statements of one call.
 * Each statement executes on a detached worker while the caller polls for
 * completion, cancellation and the per-statement deadline.
 *
 * Cancellation and timeout are best-effort: the connection is marked
 * invalid (never returned to the pool) and the driver is asked to
 * interrupt, but some drivers only stop when the statement ends on its own.
 *
 * The first failure aborts the call. Results of earlier statements are
 * only observable through the optional per-statement callback.
 */
class ExecutionEngine {
public:
    struct Config {
        std::chrono::milliseconds statement_timeout{30000};
        std::chrono::milliseconds poll_interval{50};
        std::chrono::milliseconds acquire_timeout{5000};
    };

    using ResultCallback = std::function<void(const ExecutionResult&)>;
    using RunResult = Result<std::vector<ExecutionResult>>;

    ExecutionEngine() = default;
    explicit ExecutionEngine(Config config);

    /**
     * @brief Execute every statement of sql_text
     * @param pool Live pool of the target connection
     * @param row_limit Rows kept per result set (0 = unlimited)
     * @param cancel Checked before each statement and while one runs
     * @param on_result Receives each successful result as it completes
     */
    [[nodiscard]] RunResult run(const std::shared_ptr<IConnectionPool>& pool,
                                const std::string& sql_text,
                                size_t row_limit,
                                const CancelToken& cancel,
                                const ResultCallback& on_result = {}) const;

    /**
     * @brief Resolve the connection, honoring a leading directive, then run
     *
     * A "-- connection: NAME" or "USE CONNECTION NAME;" line overrides
     * default_connection and is stripped before execution.
     */
    [[nodiscard]] RunResult run(IConnectionSource& source,
                                const std::string& default_connection,
                                const std::string& sql_text,
                                size_t row_limit,
                                const CancelToken& cancel,
                                const ResultCallback& on_result = {}) const;

    /// run() on a background thread; the callback fires on that thread
    [[nodiscard]] std::future<RunResult> run_async(std::shared_ptr<IConnectionPool> pool,
                                                   std::string sql_text,
                                                   size_t row_limit,
                                                   std::shared_ptr<CancelToken> cancel,
                                                   ResultCallback on_result = {}) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Result<ExecutionResult> execute_statement(const std::shared_ptr<PooledConnection>& conn,
                                              const std::string& statement,
                                              size_t row_limit,
                                              const CancelToken& cancel) const;

    Config config_;
};

} // namespace querydesk
