#pragma once

#include "ai/ai_client.hpp"
#include "config/config_types.hpp"
#include "executor/execution_engine.hpp"
#include "executor/mutation_applier.hpp"
#include "registry/connection_registry.hpp"
#include "schema/schema_introspector.hpp"
#include "state/app_state_store.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace querydesk {

/**
 * @brief Everything a front end needs, built from one AppConfig
 *
 * Owns the connection registry (backed by <storage>/connections.json),
 * the execution engine, the mutation applier, the schema introspector
 * and the AI client. The introspector cache follows registry changes and
 * the AI prompt uses the schema of the current connection.
 */
class ClientCore {
public:
    explicit ClientCore(AppConfig config);
    ~ClientCore();

    ClientCore(const ClientCore&) = delete;
    ClientCore& operator=(const ClientCore&) = delete;

    /// Register every compiled-in backend (safe to call repeatedly)
    static void register_backends();

    /// Apply [logging] to utils::log
    static void apply_logging(const LoggingConfig& logging);

    [[nodiscard]] static PoolConfig pool_config(const AppConfig& config);
    [[nodiscard]] static ExecutionEngine::Config engine_config(const AppConfig& config);
    [[nodiscard]] static IntrospectorConfig introspector_config(const AppConfig& config);

    [[nodiscard]] ConnectionRegistry& registry() { return *registry_; }
    [[nodiscard]] const ExecutionEngine& engine() const { return engine_; }
    [[nodiscard]] const MutationApplier& mutations() const { return mutations_; }
    [[nodiscard]] SchemaIntrospector& introspector() { return *introspector_; }
    [[nodiscard]] AiClient& ai() { return *ai_; }
    [[nodiscard]] AppStateStore& app_state() { return app_state_; }
    [[nodiscard]] const AppConfig& config() const { return config_; }

    void set_current_connection(std::string name);
    [[nodiscard]] std::string current_connection() const;

    /// Run SQL against the current connection (or the one a directive names)
    [[nodiscard]] ExecutionEngine::RunResult execute(const std::string& sql_text,
                                                     const CancelToken& cancel,
                                                     const ExecutionEngine::ResultCallback& on_result = {});

private:
    AppConfig config_;
    std::shared_ptr<ConnectionRegistry> registry_;
    ExecutionEngine engine_;
    MutationApplier mutations_;
    std::unique_ptr<SchemaIntrospector> introspector_;
    std::unique_ptr<AiClient> ai_;
    AppStateStore app_state_;
    size_t subscription_ = 0;

    mutable std::mutex current_mutex_;
    std::string current_;
};

} // namespace querydesk
