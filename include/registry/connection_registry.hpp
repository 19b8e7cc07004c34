#pragma once

#include "core/error.hpp"
#include "core/param_list.hpp"
#include "db/idb_backend.hpp"
#include "db/iconnection_pool.hpp"
#include "registry/connection_config.hpp"
#include "registry/iconnection_store.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace querydesk {

/**
 * @brief Name-based access to live connections
 *
 * What the execution engine, schema introspector and AI prompt builder
 * depend on instead of the concrete registry.
 */
class IConnectionSource {
public:
    virtual ~IConnectionSource() = default;

    /// Configured and live names, sorted
    [[nodiscard]] virtual std::vector<std::string> list() const = 0;

    /**
     * @brief Live pool for a name, reconstructed from its record if needed
     *
     * The pool stays owned by the source; callers hold it for one call.
     */
    [[nodiscard]] virtual Result<std::shared_ptr<IConnectionPool>> get(const std::string& name) = 0;
};

struct RegistryConfig {
    PoolConfig pool;                                 // template for every live pool
    std::chrono::milliseconds probe_timeout{5000};   // reconnection connectivity probe
};

/**
 * @brief Owns named connection records and their live pools
 *
 * Records are persisted through an IConnectionStore on every mutation.
 * Live pools are created lazily: add() builds one without connecting,
 * get() rebuilds one from the record, probing each password candidate
 * (stored value, then its rot13 variant) under probe_timeout.
 *
 * Thread-safe. Probing runs outside the registry lock.
 */
class ConnectionRegistry : public IConnectionSource {
public:
    /// Maps a kind to its backend; returns nullptr when not compiled in
    using BackendResolver = std::function<std::unique_ptr<IDbBackend>(DatabaseType)>;

    /// Called with the connection name after add, update, remove and reconnect
    using ChangeCallback = std::function<void(const std::string& name)>;

    explicit ConnectionRegistry(std::shared_ptr<IConnectionStore> store,
                                RegistryConfig config = {},
                                BackendResolver resolver = {});

    ~ConnectionRegistry() override;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * @brief Register a SQLite file
     * @return Display name "SQLite: <file name>", suffixed " (n)" on collision
     *
     * NOT_FOUND when the file does not exist. The file is not opened.
     */
    [[nodiscard]] Result<std::string> add_file(const std::string& path);

    /**
     * @brief Register a server connection
     * @param name Requested display name, suffixed " (n)" on collision
     * @param kind "postgresql" or "mysql" (aliases accepted)
     * @param fields host, port, user/username, password/pwd, database,
     *        driver, schema, jdbc (descriptor); anything else becomes a
     *        driver parameter. Explicit fields beat descriptor values.
     * @return Final display name
     */
    [[nodiscard]] Result<std::string> add(const std::string& name, std::string_view kind, ParamList fields);

    /// Replace an existing record in place, keeping its name
    [[nodiscard]] Result<std::string> update(const std::string& name, std::string_view kind, ParamList fields);

    [[nodiscard]] Result<std::shared_ptr<IConnectionPool>> get(const std::string& name) override;

    [[nodiscard]] std::vector<std::string> list() const override;

    /// Drop live pool and record. Absent names are a no-op.
    void remove(const std::string& name);

    /// Stored record with the password cleared
    [[nodiscard]] Result<ConnectionConfig> config(const std::string& name) const;

    size_t subscribe(ChangeCallback callback);
    void unsubscribe(size_t id);

    /// Driver target for a record (conninfo, mysql:// URI or file path)
    [[nodiscard]] static std::string build_target(const ConnectionConfig& config,
                                                  const std::string& password);

    /// Target with the password masked, for logs
    [[nodiscard]] static std::string describe_target(const ConnectionConfig& config);

    /// Default resolver over BackendRegistry
    [[nodiscard]] static std::unique_ptr<IDbBackend> registered_backend(DatabaseType kind);

private:
    Result<ConnectionConfig> prepare(std::string_view kind, ParamList fields) const;
    Result<std::shared_ptr<IConnectionPool>> make_pool(const std::string& name,
                                                       const ConnectionConfig& config,
                                                       const std::string& password) const;
    Result<bool> probe(const std::shared_ptr<IConnectionPool>& pool) const;

    std::string unique_name_locked(const std::string& base) const;
    void persist_locked();
    void notify(const std::string& name);

    std::shared_ptr<IConnectionStore> store_;
    RegistryConfig config_;
    BackendResolver resolver_;

    mutable std::mutex mutex_;
    ConfigMap configs_;
    std::unordered_map<std::string, std::shared_ptr<IConnectionPool>> pools_;

    std::mutex listeners_mutex_;
    std::unordered_map<size_t, ChangeCallback> listeners_;
    size_t next_listener_id_ = 1;
};

} // namespace querydesk
