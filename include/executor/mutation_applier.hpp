#pragma once

#include "core/error.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace querydesk {

/// Ordered column -> value pairs; nullopt is SQL NULL
using ColumnValues = std::vector<std::pair<std::string, Cell>>;

/// One edited grid row
struct PendingEdit {
    ColumnValues primary_key;
    ColumnValues changes;
};

/**
 * @brief Writes grid edits back with parameterized UPDATE / DELETE
 *
 * Identifiers are quoted with the connection's dialect and values are
 * always bound. A NULL key component matches with IS NULL.
 */
class MutationApplier {
public:
    explicit MutationApplier(std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Apply all edits in one transaction
     * @return Total affected rows
     *
     * Edits without changes or without key values are skipped. Any
     * failing UPDATE rolls back the whole batch.
     */
    [[nodiscard]] Result<uint64_t> apply_updates(IConnectionPool& pool,
                                                 const std::string& table,
                                                 const std::vector<PendingEdit>& edits) const;

    /**
     * @brief Delete the row matching primary_key in its own transaction
     * @return Rows deleted as reported by the driver (0 if already gone)
     *
     * An empty key is a VALIDATION_ERROR: it would match every row.
     */
    [[nodiscard]] Result<uint64_t> delete_row(IConnectionPool& pool,
                                              const std::string& table,
                                              const ColumnValues& primary_key) const;

    /// UPDATE text for one edit; bound values are appended to params
    [[nodiscard]] static std::string build_update(const IDbConnection& conn, const std::string& table,
                                                  const PendingEdit& edit, std::vector<Cell>& params);

    [[nodiscard]] static std::string build_delete(const IDbConnection& conn, const std::string& table,
                                                  const ColumnValues& primary_key, std::vector<Cell>& params);

private:
    std::chrono::milliseconds acquire_timeout_;
};

} // namespace querydesk
