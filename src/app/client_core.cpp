#include "app/client_core.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include "registry/json_connection_store.hpp"

// Force-link backends (auto-register via static init)
#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif
#ifdef ENABLE_MYSQL
#include "db/mysql/mysql_backend.hpp"
#endif
#ifdef ENABLE_SQLITE
#include "db/sqlite/sqlite_backend.hpp"
#endif

#include <filesystem>
#include <format>

namespace querydesk {

// ============================================================================
// Explicit Backend Registration (ensures linker includes backend objects)
// ============================================================================

void ClientCore::register_backends() {
    #ifdef ENABLE_POSTGRESQL
    BackendRegistry::instance().register_backend(
        DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    #endif

    #ifdef ENABLE_MYSQL
    BackendRegistry::instance().register_backend(
        DatabaseType::MYSQL,
        [] { return std::make_unique<MysqlBackend>(); });
    #endif

    #ifdef ENABLE_SQLITE
    BackendRegistry::instance().register_backend(
        DatabaseType::SQLITE,
        [] { return std::make_unique<SqliteBackend>(); });
    #endif
}

void ClientCore::apply_logging(const LoggingConfig& logging) {
    if (const auto level = utils::log::parse_level(logging.level)) {
        utils::log::set_level(*level);
    }
    if (!logging.file.empty() && !utils::log::set_file(logging.file)) {
        utils::log::warn(std::format("Cannot open log file {}", logging.file));
    }
}

// ============================================================================
// Config mapping
// ============================================================================

PoolConfig ClientCore::pool_config(const AppConfig& config) {
    PoolConfig pool;
    pool.min_connections = 0;
    pool.max_connections = config.pool.max_connections;
    pool.connection_timeout = std::chrono::milliseconds(config.execution.acquire_timeout_ms);
    pool.idle_timeout = std::chrono::milliseconds(config.pool.idle_timeout_ms);
    pool.max_lifetime = std::chrono::seconds(config.pool.max_lifetime_s);
    pool.health_check_query = config.pool.health_check_query;
    return pool;
}

ExecutionEngine::Config ClientCore::engine_config(const AppConfig& config) {
    ExecutionEngine::Config engine;
    engine.statement_timeout = std::chrono::milliseconds(config.execution.statement_timeout_ms);
    engine.poll_interval = std::chrono::milliseconds(config.execution.poll_interval_ms);
    engine.acquire_timeout = std::chrono::milliseconds(config.execution.acquire_timeout_ms);
    return engine;
}

IntrospectorConfig ClientCore::introspector_config(const AppConfig& config) {
    IntrospectorConfig introspection;
    introspection.call_timeout = std::chrono::milliseconds(config.introspection.call_timeout_ms);
    introspection.cache_ttl = std::chrono::seconds(config.introspection.cache_ttl_s);
    introspection.max_tables = config.introspection.max_tables;
    introspection.dump_tool = config.introspection.dump_tool;
    introspection.dump_timeout = std::chrono::milliseconds(config.introspection.dump_timeout_ms);
    introspection.acquire_timeout = std::chrono::milliseconds(config.execution.acquire_timeout_ms);
    return introspection;
}

// ============================================================================
// Construction
// ============================================================================

ClientCore::ClientCore(AppConfig config)
    : config_(std::move(config)),
      engine_(engine_config(config_)),
      mutations_(std::chrono::milliseconds(config_.execution.acquire_timeout_ms)),
      app_state_((std::filesystem::path(config_.storage.directory) / "app_state.json").string()) {
    register_backends();

    const auto store_path = (std::filesystem::path(config_.storage.directory) / "connections.json").string();
    RegistryConfig registry_config;
    registry_config.pool = pool_config(config_);
    registry_config.probe_timeout = std::chrono::milliseconds(config_.registry.probe_timeout_ms);
    registry_ = std::make_shared<ConnectionRegistry>(
        std::make_shared<JsonConnectionStore>(store_path), registry_config);

    introspector_ = std::make_unique<SchemaIntrospector>(*registry_, introspector_config(config_));
    subscription_ = registry_->subscribe([this](const std::string& name) {
        introspector_->invalidate(name);
    });

    ai_ = std::make_unique<AiClient>(config_.ai, [this] {
        const auto name = current_connection();
        return name.empty() ? std::string{} : introspector_->describe(name);
    });

    utils::log::info(std::format("querydesk ready: {} connection(s) from {}",
        registry_->list().size(), store_path));
}

ClientCore::~ClientCore() {
    if (registry_) registry_->unsubscribe(subscription_);
}

void ClientCore::set_current_connection(std::string name) {
    std::lock_guard lock(current_mutex_);
    current_ = std::move(name);
}

std::string ClientCore::current_connection() const {
    std::lock_guard lock(current_mutex_);
    return current_;
}

ExecutionEngine::RunResult ClientCore::execute(const std::string& sql_text,
                                               const CancelToken& cancel,
                                               const ExecutionEngine::ResultCallback& on_result) {
    return engine_.run(*registry_, current_connection(), sql_text,
                       config_.execution.row_limit, cancel, on_result);
}

} // namespace querydesk
