#pragma once

#include "db/idb_backend.hpp"

namespace querydesk {

/**
 * @brief MySQL backend, creates all MySQL-specific components
 *
 * Creates:
 * - MysqlConnectionFactory -> GenericConnectionPool
 * - MysqlCatalogReader (information_schema + SHOW CREATE TABLE)
 *
 * Auto-registers with BackendRegistry at static init time.
 */
class MysqlBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::MYSQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ICatalogReader> create_catalog_reader(
        const CatalogOptions& options = {}) override;
};

} // namespace querydesk
