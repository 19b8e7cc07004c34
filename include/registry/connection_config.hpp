#pragma once

#include "core/database_type.hpp"
#include "core/param_list.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace querydesk {

/**
 * @brief Persisted record of one named connection
 *
 * Server kinds use host/port/user/password/database/schema/params.
 * SQLite uses only `path`. The password is held in clear in memory;
 * stores obfuscate it at rest.
 */
struct ConnectionConfig {
    DatabaseType kind = DatabaseType::POSTGRESQL;
    std::string driver;
    std::string host;
    std::optional<uint16_t> port;
    std::string user;
    std::string password;
    std::string database;
    std::optional<std::string> schema;
    ParamList params;

    // SQLite only: absolute path of the database file
    std::string path;

    bool operator==(const ConnectionConfig&) const = default;
};

/// Display name -> record, sorted by name
using ConfigMap = std::map<std::string, ConnectionConfig>;

} // namespace querydesk
