#pragma once

#include "core/error.hpp"
#include "db/icatalog_reader.hpp"
#include "db/iconnection_pool.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace querydesk {

class IConnectionSource;

struct IntrospectorConfig {
    std::chrono::milliseconds call_timeout{5000};    // per catalog call
    std::chrono::seconds cache_ttl{60};
    size_t max_tables = 50;
    std::string dump_tool = "pg_dump";
    std::chrono::milliseconds dump_timeout{20000};
    std::chrono::milliseconds acquire_timeout{5000};
};

/**
 * @brief Describes tables and views of a named connection
 *
 * Every catalog call runs under its own deadline on a pooled connection;
 * a call that fails or times out leaves a soft marker in the output
 * instead of failing the whole description. None of the public
 * operations fail: they degrade to empty output.
 *
 * describe() output is cached per live pool for cache_ttl. Subscribe
 * invalidate() to registry changes so edits and search_path changes are
 * picked up immediately.
 */
class SchemaIntrospector {
public:
    /// Catalog reader for a kind; nullptr when the backend is not compiled in
    using CatalogResolver = std::function<std::shared_ptr<ICatalogReader>(DatabaseType)>;

    explicit SchemaIntrospector(IConnectionSource& source,
                                IntrospectorConfig config = {},
                                CatalogResolver resolver = {});

    /// Human-readable schema summary (capped at max_tables), empty if nothing is reachable
    [[nodiscard]] std::string describe(const std::string& connection);

    /// Table -> ordered column names
    [[nodiscard]] std::map<std::string, std::vector<std::string>> table_columns(const std::string& connection);

    /**
     * @brief CREATE statement for one table, empty when every strategy fails
     *
     * Order: DDL reflected from columns and keys; the dialect's own DDL
     * (sqlite_master, SHOW CREATE TABLE, pg_catalog); the dump tool.
     */
    [[nodiscard]] std::string create_statement(const std::string& connection, const std::string& table);

    /// Whole-schema DDL: one dump tool run when available, else per-table DDL
    [[nodiscard]] std::string create_statements_for_connection(const std::string& connection);

    [[nodiscard]] std::vector<std::string> primary_key_columns(const std::string& connection,
                                                               const std::string& table);

    void invalidate(const std::string& connection);
    void invalidate_all();

    /// CREATE TABLE text from reflected metadata
    [[nodiscard]] static std::string reflected_ddl(const IDbConnection& conn,
                                                   const std::string& table,
                                                   const std::vector<ColumnInfo>& columns,
                                                   const std::vector<std::string>& primary_key,
                                                   const std::vector<ForeignKeyInfo>& foreign_keys);

private:
    struct Target {
        std::shared_ptr<IConnectionPool> pool;
        std::shared_ptr<ICatalogReader> reader;
    };

    struct CacheEntry {
        std::string name;
        std::weak_ptr<IConnectionPool> pool;
        std::chrono::steady_clock::time_point stored_at;
        std::string text;
    };

    template<typename T>
    using CatalogCall = std::function<Result<T>(ICatalogReader&, IDbConnection&)>;

    Result<Target> resolve(const std::string& connection);

    /// Run one catalog call on its own pooled connection under call_timeout
    template<typename T>
    Result<T> bounded(const Target& target, CatalogCall<T> call, std::string_view what) const;

    std::string create_statement_for(const Target& target, const std::string& table) const;

    IConnectionSource& source_;
    IntrospectorConfig config_;
    CatalogResolver resolver_;

    std::mutex cache_mutex_;
    std::unordered_map<const IConnectionPool*, CacheEntry> cache_;
};

} // namespace querydesk
