#pragma once

#include "db/generic_connection_pool.hpp"
#include "db/icatalog_reader.hpp"
#include "db/iconnection_factory.hpp"
#include "db/idb_backend.hpp"
#include "db/idb_connection.hpp"
#include "registry/connection_registry.hpp"
#include "registry/iconnection_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace querydesk::testing {

/**
 * @brief Shared state behind every MockConnection a MockFactory opens
 *
 * Tests script responses through `handler` and inspect `executed`.
 * Statements containing `block_marker` park until interrupted (or
 * block_limit passes) to simulate long-running queries.
 */
struct MockDatabase {
    using Handler = std::function<DbResultSet(const std::string& sql, const std::vector<Cell>& params)>;

    Handler handler;
    std::function<bool(const std::string& target)> accept;
    std::string reject_message = "password authentication failed";
    std::string block_marker;
    std::chrono::milliseconds block_limit{5000};
    bool healthy = true;

    std::atomic<int> opened{0};
    std::atomic<int> closed{0};
    std::atomic<int> interrupts{0};

    void record(const std::string& sql, const std::vector<Cell>& params = {}) {
        std::lock_guard lock(mutex);
        executed.push_back(sql);
        last_params = params;
    }

    std::vector<std::string> statements() const {
        std::lock_guard lock(mutex);
        return executed;
    }

    std::vector<std::string> connect_targets() const {
        std::lock_guard lock(mutex);
        return targets;
    }

    mutable std::mutex mutex;
    std::vector<std::string> executed;
    std::vector<Cell> last_params;
    std::vector<std::string> targets;
};

inline DbResultSet ok_rows(std::vector<std::string> columns, std::vector<Row> rows) {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;
    rs.column_names = std::move(columns);
    rs.rows = std::move(rows);
    return rs;
}

inline DbResultSet ok_affected(uint64_t affected) {
    DbResultSet rs;
    rs.success = true;
    rs.affected_rows = affected;
    return rs;
}

inline DbResultSet failed(std::string message) {
    DbResultSet rs;
    rs.success = false;
    rs.error_message = std::move(message);
    return rs;
}

class MockConnection : public IDbConnection {
public:
    MockConnection(std::shared_ptr<MockDatabase> db, DatabaseType type)
        : db_(std::move(db)), type_(type) {}

    DbResultSet execute(const std::string& sql, size_t max_rows = 0) override {
        auto rs = run(sql, {});
        if (max_rows > 0 && rs.rows.size() > max_rows) rs.rows.resize(max_rows);
        return rs;
    }

    DbResultSet execute_params(const std::string& sql, const std::vector<Cell>& params) override {
        return run(sql, params);
    }

    bool is_healthy(const std::string&) override { return connected_ && db_->healthy; }
    bool is_connected() const override { return connected_; }
    bool set_query_timeout(uint32_t timeout_ms) override {
        timeout_ms_ = timeout_ms;
        return true;
    }

    void interrupt() override {
        {
            std::lock_guard lock(mutex_);
            interrupted_ = true;
        }
        db_->interrupts.fetch_add(1);
        cv_.notify_all();
    }

    void close() override {
        if (connected_) {
            connected_ = false;
            db_->closed.fetch_add(1);
        }
    }

    DatabaseType type() const override { return type_; }

    std::string quote_identifier(std::string_view ident) const override {
        const char q = type_ == DatabaseType::MYSQL ? '`' : '"';
        std::string out(1, q);
        for (const char c : ident) {
            if (c == q) out += q;
            out += c;
        }
        out += q;
        return out;
    }

    std::string placeholder(size_t n) const override {
        return type_ == DatabaseType::POSTGRESQL ? "$" + std::to_string(n) : "?";
    }

    uint32_t timeout_ms() const { return timeout_ms_; }

private:
    DbResultSet run(const std::string& sql, const std::vector<Cell>& params) {
        db_->record(sql, params);
        if (!db_->block_marker.empty() && sql.find(db_->block_marker) != std::string::npos) {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, db_->block_limit, [this] { return interrupted_; });
            if (interrupted_) {
                interrupted_ = false;
                return failed("canceling statement due to user request");
            }
        }
        if (db_->handler) return db_->handler(sql, params);
        return ok_affected(0);
    }

    std::shared_ptr<MockDatabase> db_;
    DatabaseType type_;
    bool connected_ = true;
    uint32_t timeout_ms_ = 0;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool interrupted_ = false;
};

class MockFactory : public IConnectionFactory {
public:
    MockFactory(std::shared_ptr<MockDatabase> db, DatabaseType type)
        : db_(std::move(db)), type_(type) {}

    Result<std::unique_ptr<IDbConnection>> create(const std::string& target) override {
        {
            std::lock_guard lock(db_->mutex);
            db_->targets.push_back(target);
        }
        if (db_->accept && !db_->accept(target)) {
            return Result<std::unique_ptr<IDbConnection>>::error(ErrorCategory::UNAVAILABLE, db_->reject_message);
        }
        db_->opened.fetch_add(1);
        return Result<std::unique_ptr<IDbConnection>>::ok(std::make_unique<MockConnection>(db_, type_));
    }

private:
    std::shared_ptr<MockDatabase> db_;
    DatabaseType type_;
};

/**
 * @brief Catalog reader serving canned metadata
 *
 * Tables listed in `slow` sleep for `slow_delay` before answering columns();
 * tables in `broken` fail columns().
 */
class MockCatalogReader : public ICatalogReader {
public:
    std::vector<std::string> tables;
    std::vector<std::string> views;
    std::map<std::string, std::vector<ColumnInfo>> column_map;
    std::map<std::string, std::vector<std::string>> primary_keys;
    std::map<std::string, std::vector<ForeignKeyInfo>> foreign_key_map;
    std::map<std::string, std::vector<IndexInfo>> index_map;
    std::map<std::string, std::string> view_sql;
    std::map<std::string, std::string> native_ddl;
    std::map<std::string, std::string> dumps;      // "" key = whole schema
    std::set<std::string> broken;
    std::set<std::string> slow;
    std::chrono::milliseconds slow_delay{500};

    std::atomic<int> table_list_calls{0};
    std::atomic<int> dump_calls{0};

    Result<std::vector<std::string>> table_names(IDbConnection&) override {
        table_list_calls.fetch_add(1);
        return Result<std::vector<std::string>>::ok(tables);
    }

    Result<std::vector<std::string>> view_names(IDbConnection&) override {
        return Result<std::vector<std::string>>::ok(views);
    }

    Result<std::vector<ColumnInfo>> columns(IDbConnection&, const std::string& table) override {
        if (slow.contains(table)) std::this_thread::sleep_for(slow_delay);
        if (broken.contains(table)) {
            return Result<std::vector<ColumnInfo>>::error(ErrorCategory::STATEMENT_ERROR, "permission denied");
        }
        const auto it = column_map.find(table);
        if (it == column_map.end()) {
            return Result<std::vector<ColumnInfo>>::error(ErrorCategory::NOT_FOUND, "no such table: " + table);
        }
        return Result<std::vector<ColumnInfo>>::ok(it->second);
    }

    Result<std::vector<std::string>> primary_key(IDbConnection&, const std::string& table) override {
        return Result<std::vector<std::string>>::ok(lookup(primary_keys, table));
    }

    Result<std::vector<ForeignKeyInfo>> foreign_keys(IDbConnection&, const std::string& table) override {
        return Result<std::vector<ForeignKeyInfo>>::ok(lookup(foreign_key_map, table));
    }

    Result<std::vector<IndexInfo>> indexes(IDbConnection&, const std::string& table) override {
        return Result<std::vector<IndexInfo>>::ok(lookup(index_map, table));
    }

    Result<std::string> view_definition(IDbConnection&, const std::string& view) override {
        const auto it = view_sql.find(view);
        if (it == view_sql.end()) {
            return Result<std::string>::error(ErrorCategory::NOT_FOUND, "no definition");
        }
        return Result<std::string>::ok(it->second);
    }

    Result<std::string> native_create_statement(IDbConnection&, const std::string& table) override {
        const auto it = native_ddl.find(table);
        if (it == native_ddl.end()) {
            return Result<std::string>::error(ErrorCategory::NOT_FOUND, "no native DDL");
        }
        return Result<std::string>::ok(it->second);
    }

    Result<std::string> dump_create_statement(const std::string&, const std::string& table,
                                              std::chrono::milliseconds) override {
        dump_calls.fetch_add(1);
        const auto it = dumps.find(table);
        if (it == dumps.end()) {
            return Result<std::string>::error(ErrorCategory::NOT_FOUND, "dump tool not available");
        }
        return Result<std::string>::ok(it->second);
    }

private:
    template<typename V>
    static V lookup(const std::map<std::string, V>& m, const std::string& key) {
        const auto it = m.find(key);
        return it == m.end() ? V{} : it->second;
    }
};

class MockBackend : public IDbBackend {
public:
    MockBackend(std::shared_ptr<MockDatabase> db, DatabaseType type,
                std::shared_ptr<ICatalogReader> catalog = nullptr)
        : db_(std::move(db)), type_(type), catalog_(std::move(catalog)) {}

    DatabaseType type() const override { return type_; }

    std::shared_ptr<IConnectionPool> create_pool(const std::string& name, const PoolConfig& config) override {
        return std::make_shared<GenericConnectionPool>(name, type_, config,
            std::make_shared<MockFactory>(db_, type_));
    }

    std::shared_ptr<ICatalogReader> create_catalog_reader(const CatalogOptions&) override {
        return catalog_ ? catalog_ : std::make_shared<MockCatalogReader>();
    }

private:
    std::shared_ptr<MockDatabase> db_;
    DatabaseType type_;
    std::shared_ptr<ICatalogReader> catalog_;
};

/// Resolver serving MockBackends over one shared MockDatabase for every kind
inline ConnectionRegistry::BackendResolver mock_resolver(std::shared_ptr<MockDatabase> db) {
    return [db](DatabaseType type) -> std::unique_ptr<IDbBackend> {
        return std::make_unique<MockBackend>(db, type);
    };
}

class InMemoryConnectionStore : public IConnectionStore {
public:
    ConfigMap data;
    std::atomic<int> saves{0};
    bool fail_save = false;

    ConfigMap load() override { return data; }

    bool save(const ConfigMap& configs) override {
        saves.fetch_add(1);
        if (fail_save) return false;
        data = configs;
        return true;
    }
};

/// Connection source handing out fixed pools by name
class FixedConnectionSource : public IConnectionSource {
public:
    std::map<std::string, std::shared_ptr<IConnectionPool>> pools;

    std::vector<std::string> list() const override {
        std::vector<std::string> names;
        for (const auto& [name, _] : pools) names.push_back(name);
        return names;
    }

    Result<std::shared_ptr<IConnectionPool>> get(const std::string& name) override {
        const auto it = pools.find(name);
        if (it == pools.end()) {
            return Result<std::shared_ptr<IConnectionPool>>::error(ErrorCategory::NOT_FOUND,
                "Connection '" + name + "' is not configured");
        }
        return Result<std::shared_ptr<IConnectionPool>>::ok(it->second);
    }
};

inline std::shared_ptr<IConnectionPool> make_mock_pool(std::shared_ptr<MockDatabase> db,
                                                       DatabaseType type,
                                                       const std::string& name = "mock",
                                                       PoolConfig config = {}) {
    if (config.connection_string.empty()) config.connection_string = "mock://" + name;
    return std::make_shared<GenericConnectionPool>(name, type, std::move(config),
        std::make_shared<MockFactory>(std::move(db), type));
}

} // namespace querydesk::testing
