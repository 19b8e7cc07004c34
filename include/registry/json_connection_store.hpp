#pragma once

#include "core/error.hpp"
#include "registry/iconnection_store.hpp"

#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

namespace querydesk {

/**
 * @brief IConnectionStore backed by a JSON file
 *
 * Layout: { "<name>": { "type", "driver", "params", "host", "port",
 * "user", "password", "database", "schema" } } for server kinds and
 * { "<name>": { "type": "sqlite", "path" } } for files. Passwords are
 * letter-rotated (rot13) on disk. This hides them from a casual glance
 * and nothing more.
 *
 * Records with a legacy "url" field are decoded from the URI.
 *
 * A file that does not parse as UTF-8, BOM-prefixed UTF-8 or Latin-1
 * JSON is copied to "<file>.bak" and loading continues with no records.
 */
class JsonConnectionStore : public IConnectionStore {
public:
    explicit JsonConnectionStore(std::string path);

    [[nodiscard]] ConfigMap load() override;
    [[nodiscard]] bool save(const ConfigMap& configs) override;

    [[nodiscard]] const std::string& path() const { return path_; }

    [[nodiscard]] static nlohmann::ordered_json to_json(const ConnectionConfig& config);
    [[nodiscard]] static Result<ConnectionConfig> from_json(const nlohmann::json& record);

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace querydesk
