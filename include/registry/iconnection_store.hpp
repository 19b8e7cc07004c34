#pragma once

#include "registry/connection_config.hpp"

namespace querydesk {

/**
 * @brief Durable storage for connection records
 *
 * Writes are whole-map replacements. load() never fails: unreadable
 * storage yields an empty map.
 */
class IConnectionStore {
public:
    virtual ~IConnectionStore() = default;

    [[nodiscard]] virtual ConfigMap load() = 0;

    /// Replace the stored map; false when the write failed
    [[nodiscard]] virtual bool save(const ConfigMap& configs) = 0;
};

} // namespace querydesk
