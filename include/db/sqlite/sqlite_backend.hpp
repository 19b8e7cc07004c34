#pragma once

#include "db/idb_backend.hpp"

namespace querydesk {

/**
 * @brief SQLite backend for file databases
 *
 * Auto-registers with BackendRegistry at static init time.
 */
class SqliteBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::SQLITE;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ICatalogReader> create_catalog_reader(
        const CatalogOptions& options = {}) override;
};

} // namespace querydesk
