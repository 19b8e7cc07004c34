#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_catalog_reader.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/backend_registry.hpp"

namespace querydesk {

std::shared_ptr<IConnectionPool> PgBackend::create_pool(
    const std::string& name,
    const PoolConfig& config) {

    auto factory = std::make_shared<PgConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(
        name, DatabaseType::POSTGRESQL, config, std::move(factory));
}

std::shared_ptr<ICatalogReader> PgBackend::create_catalog_reader(const CatalogOptions& options) {
    return std::make_shared<PgCatalogReader>(options.dump_tool);
}

// Auto-register PostgreSQL backend at static initialization
namespace {
    struct PgBackendRegistrar {
        PgBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                DatabaseType::POSTGRESQL,
                [] { return std::make_unique<PgBackend>(); });
        }
    };
    static PgBackendRegistrar pg_registrar;
}

} // namespace querydesk
