#include "db/mysql/mysql_backend.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_catalog_reader.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/backend_registry.hpp"

namespace querydesk {

std::shared_ptr<IConnectionPool> MysqlBackend::create_pool(
    const std::string& name,
    const PoolConfig& config) {

    auto factory = std::make_shared<MysqlConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(
        name, DatabaseType::MYSQL, config, std::move(factory));
}

std::shared_ptr<ICatalogReader> MysqlBackend::create_catalog_reader(const CatalogOptions&) {
    return std::make_shared<MysqlCatalogReader>();
}

// Auto-register MySQL backend at static initialization
namespace {
    struct MysqlBackendRegistrar {
        MysqlBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                DatabaseType::MYSQL,
                [] { return std::make_unique<MysqlBackend>(); });
        }
    };
    static MysqlBackendRegistrar mysql_registrar;
}

} // namespace querydesk
