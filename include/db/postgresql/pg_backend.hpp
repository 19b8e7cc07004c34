#pragma once

#include "db/idb_backend.hpp"

namespace querydesk {

/**
 * @brief PostgreSQL backend, creates all PG-specific components
 *
 * Creates:
 * - PgConnectionFactory -> GenericConnectionPool
 * - PgCatalogReader (pg_catalog + information_schema, pg_dump fallback)
 *
 * Auto-registers with BackendRegistry at static init time.
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ICatalogReader> create_catalog_reader(
        const CatalogOptions& options = {}) override;
};

} // namespace querydesk
