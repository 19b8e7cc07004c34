#include "registry/json_connection_store.hpp"
#include "registry/descriptor_parser.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace querydesk {

namespace {

std::string latin1_to_utf8(std::string_view in) {
    std::string out;
    out.reserve(in.size() + in.size() / 4);
    for (const char ch : in) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out += ch;
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

// Decode attempts in order: as-is, BOM stripped, Latin-1
nlohmann::json parse_with_fallbacks(const std::string& raw) {
    auto doc = nlohmann::json::parse(raw, nullptr, false);
    if (!doc.is_discarded()) return doc;

    if (raw.starts_with("\xEF\xBB\xBF")) {
        doc = nlohmann::json::parse(raw.substr(3), nullptr, false);
        if (!doc.is_discarded()) return doc;
    }

    return nlohmann::json::parse(latin1_to_utf8(raw), nullptr, false);
}

std::optional<std::string> string_field(const nlohmann::json& node, const char* key) {
    if (node.contains(key) && node[key].is_string()) {
        return node[key].get<std::string>();
    }
    return std::nullopt;
}

std::string scalar_text(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

void backup_corrupt_file(const std::string& path) {
    const auto backup = path + ".bak";
    std::error_code ec;
    std::filesystem::copy_file(path, backup, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        utils::log::warn(std::format("Could not back up unreadable {}: {}", path, ec.message()));
    } else {
        utils::log::warn(std::format("Connection file {} is unreadable; saved a copy to {}", path, backup));
    }
}

} // namespace

JsonConnectionStore::JsonConnectionStore(std::string path)
    : path_(std::move(path)) {}

// ============================================================================
// Record conversion
// ============================================================================

nlohmann::ordered_json JsonConnectionStore::to_json(const ConnectionConfig& config) {
    nlohmann::ordered_json record;
    record["type"] = std::string(database_type_to_string(config.kind));
    if (config.kind == DatabaseType::SQLITE) {
        record["path"] = config.path;
        return record;
    }

    record["driver"] = config.driver;
    auto params = nlohmann::ordered_json::object();
    for (const auto& [key, value] : config.params) {
        params[key] = value;
    }
    record["params"] = std::move(params);
    record["host"] = config.host;
    if (config.port) {
        record["port"] = *config.port;
    } else {
        record["port"] = nullptr;
    }
    record["user"] = config.user;
    record["password"] = utils::rot13(config.password);
    record["database"] = config.database;
    if (config.schema) {
        record["schema"] = *config.schema;
    }
    return record;
}

Result<ConnectionConfig> JsonConnectionStore::from_json(const nlohmann::json& record) {
    using R = Result<ConnectionConfig>;
    if (!record.is_object()) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "Connection record is not an object");
    }

    ConnectionConfig config;

    // Legacy records carry a single URL instead of discrete fields
    if (const auto url = string_field(record, "url")) {
        auto fields = DescriptorParser::parse_uri(*url);
        if (fields.is_error()) return R::error_from(fields);
        auto& f = fields.value();
        const auto kind = parse_database_type(f.kind);
        if (!kind) {
            return R::error(ErrorCategory::VALIDATION_ERROR,
                std::format("Unsupported connection type '{}'", f.kind));
        }
        config.kind = *kind;
        config.driver = std::string(default_driver(*kind));
        if (*kind == DatabaseType::SQLITE) {
            config.path = f.database;
            return R::ok(std::move(config));
        }
        config.host = f.host;
        config.port = f.port;
        config.user = f.user.value_or("");
        config.password = f.password.value_or("");
        config.database = f.database;
        config.schema = f.schema;
        config.params = std::move(f.params);
        return R::ok(std::move(config));
    }

    const auto type_name = string_field(record, "type").value_or("");
    const auto kind = parse_database_type(type_name);
    if (!kind) {
        return R::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Unsupported connection type '{}'", type_name));
    }
    config.kind = *kind;
    config.driver = string_field(record, "driver").value_or(std::string(default_driver(*kind)));

    if (*kind == DatabaseType::SQLITE) {
        auto path = string_field(record, "path");
        if (!path || path->empty()) {
            return R::error(ErrorCategory::VALIDATION_ERROR, "Missing sqlite path in record");
        }
        config.path = std::move(*path);
        return R::ok(std::move(config));
    }

    config.host = string_field(record, "host").value_or("");
    config.user = string_field(record, "user").value_or("");
    config.password = utils::rot13(string_field(record, "password").value_or(""));
    config.database = string_field(record, "database")
        .value_or(string_field(record, "db").value_or(""));
    config.schema = string_field(record, "schema");
    if (config.schema && config.schema->empty()) config.schema.reset();

    if (record.contains("port") && !record["port"].is_null()) {
        const auto text = scalar_text(record["port"]);
        const auto port = utils::try_parse_int<uint32_t>(text);
        if (!port || *port == 0 || *port > 65535) {
            return R::error(ErrorCategory::VALIDATION_ERROR, std::format("Invalid port '{}'", text));
        }
        config.port = static_cast<uint16_t>(*port);
    }

    if (record.contains("params") && record["params"].is_object()) {
        for (const auto& [key, value] : record["params"].items()) {
            if (value.is_null()) continue;
            config.params.set(key, scalar_text(value));
        }
    }
    return R::ok(std::move(config));
}

// ============================================================================
// File I/O
// ============================================================================

ConfigMap JsonConnectionStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    ConfigMap configs;

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return configs;
    }
    const std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    const auto doc = parse_with_fallbacks(raw);
    if (doc.is_discarded() || !doc.is_object()) {
        backup_corrupt_file(path_);
        return configs;
    }

    for (const auto& [name, record] : doc.items()) {
        auto config = from_json(record);
        if (config.is_error()) {
            utils::log::warn(std::format("Skipping connection '{}': {}", name, config.error_message()));
            continue;
        }
        configs.emplace(name, std::move(config.value()));
    }

    std::string names;
    for (const auto& [name, _] : configs) {
        names += names.empty() ? name : ", " + name;
    }
    utils::log::debug(std::format("Loaded {} connection(s) from {}: [{}]", configs.size(), path_, names));
    return configs;
}

bool JsonConnectionStore::save(const ConfigMap& configs) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::ordered_json doc = nlohmann::ordered_json::object();
    for (const auto& [name, config] : configs) {
        doc[name] = to_json(config);
    }

    std::string text;
    try {
        text = doc.dump(2);
    } catch (const nlohmann::json::exception& e) {
        // Raw non-UTF-8 bytes (e.g. from a file name) cannot be encoded
        utils::log::warn(std::format("Cannot serialize connection file {}: {}", path_, e.what()));
        return false;
    }

    std::error_code ec;
    const std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    const auto tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            utils::log::warn(std::format("Cannot write connection file {}", tmp));
            return false;
        }
        out << text << '\n';
        if (!out) {
            utils::log::warn(std::format("Write to {} failed", tmp));
            return false;
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        utils::log::warn(std::format("Cannot replace {}: {}", path_, ec.message()));
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace querydesk
