#pragma once

#include "core/database_type.hpp"
#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/icatalog_reader.hpp"
#include <memory>
#include <string>

namespace querydesk {

/// Options for catalog readers; only backends with a dump tool use dump_tool
struct CatalogOptions {
    std::string dump_tool = "pg_dump";
};

/**
 * @brief Abstract database backend, creates all DB-specific components
 *
 * Each database type (PostgreSQL, MySQL, SQLite) provides a concrete
 * implementation that creates the right pool and catalog reader.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::POSTGRESQL);
 *   auto pool = backend->create_pool("Sales", config);
 *   auto catalog = backend->create_catalog_reader();
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Create a lazily-connecting pool for one named connection */
    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& name,
        const PoolConfig& config) = 0;

    /** @brief Create the catalog reader for this dialect */
    [[nodiscard]] virtual std::shared_ptr<ICatalogReader> create_catalog_reader(
        const CatalogOptions& options = {}) = 0;
};

} // namespace querydesk
