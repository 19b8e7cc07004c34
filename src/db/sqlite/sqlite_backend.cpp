#include "db/sqlite/sqlite_backend.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "db/sqlite/sqlite_catalog_reader.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/backend_registry.hpp"

namespace querydesk {

std::shared_ptr<IConnectionPool> SqliteBackend::create_pool(
    const std::string& name,
    const PoolConfig& config) {

    auto factory = std::make_shared<SqliteConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(
        name, DatabaseType::SQLITE, config, std::move(factory));
}

std::shared_ptr<ICatalogReader> SqliteBackend::create_catalog_reader(const CatalogOptions&) {
    return std::make_shared<SqliteCatalogReader>();
}

namespace {
    struct SqliteBackendRegistrar {
        SqliteBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                DatabaseType::SQLITE,
                [] { return std::make_unique<SqliteBackend>(); });
        }
    };
    static SqliteBackendRegistrar sqlite_registrar;
}

} // namespace querydesk
