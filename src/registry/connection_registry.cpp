#include "registry/connection_registry.hpp"
#include "registry/descriptor_parser.hpp"
#include "db/backend_registry.hpp"
#include "db/idb_connection.hpp"
#include "db/pooled_connection.hpp"
#include "core/deadline.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <regex>
#include <set>

namespace querydesk {

namespace {

constexpr std::string_view kSchemaKeys[] = {"schema", "search_path", "currentSchema"};

uint16_t default_port(DatabaseType kind) {
    return kind == DatabaseType::MYSQL ? 3306 : 5432;
}

bool valid_param_key(std::string_view key) {
    if (key.empty()) return false;
    return std::all_of(key.begin(), key.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
    });
}

// Non-empty value of key, removing the key either way
std::optional<std::string> take_nonempty(ParamList& fields, std::string_view key) {
    auto value = fields.take(key);
    if (value && !utils::trim(*value).empty()) return value;
    return std::nullopt;
}

/// "-c search_path=foo,bar -c TimeZone=UTC" -> "foo,bar"
std::optional<std::string> schema_from_options(const std::string& options) {
    static const std::regex search_path(R"(search_path\s*=\s*([\w",]+))");
    std::smatch m;
    if (!std::regex_search(options, m, search_path)) return std::nullopt;
    std::string value = utils::trim(m[1].str());
    value.erase(std::remove(value.begin(), value.end(), '"'), value.end());
    if (value.empty()) return std::nullopt;
    return value;
}

std::string conninfo_quote(std::string_view value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

void append_conninfo(std::string& out, std::string_view key, std::string_view value) {
    if (!out.empty()) out += ' ';
    out += key;
    out += '=';
    out += conninfo_quote(value);
}

/// Session hook applying the saved schema on every new physical connection
std::function<void(IDbConnection&)> search_path_hook(const std::string& schema) {
    std::vector<std::string> parts;
    for (auto part : utils::split(schema, ',')) {
        part.erase(std::remove(part.begin(), part.end(), '"'), part.end());
        part = utils::trim(part);
        if (!part.empty()) parts.push_back(std::move(part));
    }
    return [parts](IDbConnection& conn) {
        if (parts.empty()) return;
        std::string sql = "SET search_path TO ";
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += conn.quote_identifier(parts[i]);
        }
        const auto rs = conn.execute(sql);
        if (!rs.success) {
            utils::log::warn(std::format("Could not apply search_path: {}", rs.error_message));
        }
    };
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<IConnectionStore> store,
                                       RegistryConfig config,
                                       BackendResolver resolver)
    : store_(std::move(store)),
      config_(std::move(config)),
      resolver_(resolver ? std::move(resolver) : BackendResolver(&ConnectionRegistry::registered_backend)),
      configs_(store_->load()) {}

ConnectionRegistry::~ConnectionRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, pool] : pools_) {
        pool->drain();
    }
}

std::unique_ptr<IDbBackend> ConnectionRegistry::registered_backend(DatabaseType kind) {
    auto& registry = BackendRegistry::instance();
    if (!registry.has_backend(kind)) return nullptr;
    return registry.create(kind);
}

// ============================================================================
// Targets
// ============================================================================

std::string ConnectionRegistry::build_target(const ConnectionConfig& config, const std::string& password) {
    switch (config.kind) {
        case DatabaseType::SQLITE:
            return config.path;

        case DatabaseType::POSTGRESQL: {
            std::string out;
            if (!config.host.empty()) append_conninfo(out, "host", config.host);
            if (config.port) append_conninfo(out, "port", std::to_string(*config.port));
            if (!config.database.empty()) append_conninfo(out, "dbname", config.database);
            if (!config.user.empty()) append_conninfo(out, "user", config.user);
            if (!password.empty()) append_conninfo(out, "password", password);
            for (const auto& [key, value] : config.params) {
                append_conninfo(out, key, value);
            }
            return out;
        }

        case DatabaseType::MYSQL: {
            std::string out = "mysql://";
            if (!config.user.empty() || !password.empty()) {
                out += DescriptorParser::percent_encode(config.user);
                if (!password.empty()) out += ":" + DescriptorParser::percent_encode(password);
                out += '@';
            }
            out += (config.host.find(':') != std::string::npos) ? "[" + config.host + "]" : config.host;
            if (config.port) out += ":" + std::to_string(*config.port);
            out += "/" + DescriptorParser::percent_encode(config.database);
            char sep = '?';
            for (const auto& [key, value] : config.params) {
                out += sep;
                out += DescriptorParser::percent_encode(key) + "=" + DescriptorParser::percent_encode(value);
                sep = '&';
            }
            return out;
        }
    }
    return {};
}

std::string ConnectionRegistry::describe_target(const ConnectionConfig& config) {
    return build_target(config, config.password.empty() ? "" : "***");
}

// ============================================================================
// Record preparation
// ============================================================================

Result<ConnectionConfig> ConnectionRegistry::prepare(std::string_view kind, ParamList fields) const {
    using R = Result<ConnectionConfig>;

    // Field aliases
    if (auto username = fields.take("username"); username && !fields.contains("user")) {
        fields.set("user", std::move(*username));
    }
    if (auto pwd = fields.take("pwd"); pwd && !fields.contains("password")) {
        fields.set("password", std::move(*pwd));
    }

    auto type = parse_database_type(utils::trim(kind));

    // A descriptor fills whatever the explicit fields left open
    if (auto descriptor = take_nonempty(fields, "jdbc")) {
        auto parsed = DescriptorParser::parse(*descriptor);
        if (parsed.is_error()) {
            return R::error(ErrorCategory::PARSE_ERROR,
                std::format("Failed to parse descriptor: {}", parsed.error_message()));
        }
        auto& f = parsed.value();
        type = parse_database_type(f.kind);
        if (!type) {
            return R::error(ErrorCategory::VALIDATION_ERROR,
                std::format("Unsupported connection type: {}", f.kind));
        }
        if (!f.host.empty()) fields.set_default("host", f.host);
        if (f.port) fields.set_default("port", std::to_string(*f.port));
        if (!f.database.empty()) fields.set_default("database", f.database);
        if (f.user) fields.set_default("user", *f.user);
        if (f.password) fields.set_default("password", *f.password);
        if (f.schema) fields.set_default("schema", *f.schema);
        for (const auto& [key, value] : f.params) {
            fields.set_default(key, value);
        }
    }

    if (!type || *type == DatabaseType::SQLITE) {
        return R::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Unsupported connection type: {}", kind));
    }

    ConnectionConfig config;
    config.kind = *type;
    config.driver = take_nonempty(fields, "driver").value_or(std::string(default_driver(*type)));
    config.host = take_nonempty(fields, "host").value_or("localhost");

    if (auto port_text = take_nonempty(fields, "port")) {
        const auto port = utils::try_parse_int<uint32_t>(utils::trim(*port_text));
        if (!port || *port == 0 || *port > 65535) {
            return R::error(ErrorCategory::VALIDATION_ERROR,
                std::format("Invalid port '{}'", *port_text));
        }
        config.port = static_cast<uint16_t>(*port);
    } else {
        config.port = default_port(*type);
    }

    config.user = fields.take("user").value_or("");
    config.password = fields.take("password").value_or("");
    config.database = fields.take("database").value_or("");

    std::optional<std::string> schema;
    for (const auto key : kSchemaKeys) {
        auto value = take_nonempty(fields, key);
        if (value && !schema) schema = utils::trim(*value);
    }

    for (const auto& [key, value] : fields) {
        if (!valid_param_key(key)) {
            return R::error(ErrorCategory::VALIDATION_ERROR,
                std::format("Invalid parameter name '{}'", key));
        }
        if (value.empty()) continue;
        config.params.set(key, value);
    }

    if (!schema) {
        if (auto options = config.params.get("options")) schema = schema_from_options(*options);
    }
    if (schema && config.kind == DatabaseType::POSTGRESQL) {
        config.params.set("options", DescriptorParser::append_option(
            config.params.get("options").value_or(""), "-c search_path=" + *schema));
    }
    config.schema = std::move(schema);
    return R::ok(std::move(config));
}

Result<std::shared_ptr<IConnectionPool>> ConnectionRegistry::make_pool(const std::string& name,
                                                                       const ConnectionConfig& config,
                                                                       const std::string& password) const {
    using R = Result<std::shared_ptr<IConnectionPool>>;

    auto backend = resolver_(config.kind);
    if (!backend) {
        return R::error(ErrorCategory::UNAVAILABLE,
            std::format("No {} backend is available in this build", database_type_to_string(config.kind)));
    }

    PoolConfig pool_config = config_.pool;
    pool_config.connection_string = build_target(config, password);
    if (config.kind == DatabaseType::POSTGRESQL && config.schema) {
        pool_config.on_connect = search_path_hook(*config.schema);
    }
    return R::ok(backend->create_pool(name, pool_config));
}

Result<bool> ConnectionRegistry::probe(const std::shared_ptr<IConnectionPool>& pool) const {
    const auto timeout = config_.probe_timeout;
    const std::string query = config_.pool.health_check_query.empty()
        ? std::string("SELECT 1") : config_.pool.health_check_query;
    return run_with_deadline<bool>([pool, timeout, query]() -> Result<bool> {
        auto conn = pool->acquire(timeout);
        if (!conn) {
            auto error = pool->last_error();
            return Result<bool>::error(ErrorCategory::UNAVAILABLE,
                error.empty() ? "No connection could be acquired" : std::move(error));
        }
        // An open handle is not enough: the server (or file) must answer
        const auto answer = (*conn)->execute(query);
        if (!answer.success) {
            conn->invalidate();
            return Result<bool>::error(ErrorCategory::UNAVAILABLE, answer.error_message);
        }
        return Result<bool>::ok(true);
    }, timeout, "Connectivity probe");
}

// ============================================================================
// Registration
// ============================================================================

Result<std::string> ConnectionRegistry::add_file(const std::string& path) {
    using R = Result<std::string>;

    std::error_code ec;
    const std::filesystem::path file(path);
    if (path.empty() || !std::filesystem::exists(file, ec)) {
        return R::error(ErrorCategory::NOT_FOUND, std::format("SQLite file not found: {}", path));
    }

    ConnectionConfig config;
    config.kind = DatabaseType::SQLITE;
    config.driver = std::string(default_driver(DatabaseType::SQLITE));
    config.path = std::filesystem::absolute(file, ec).lexically_normal().string();

    std::string name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        name = unique_name_locked("SQLite: " + file.filename().string());
        auto pool = make_pool(name, config, "");
        if (pool.is_error()) return R::error_from(pool);
        configs_[name] = config;
        pools_[name] = std::move(pool.value());
        persist_locked();
    }
    utils::log::info(std::format("Added SQLite connection '{}': {}", name, config.path));
    notify(name);
    return R::ok(std::move(name));
}

Result<std::string> ConnectionRegistry::add(const std::string& name, std::string_view kind, ParamList fields) {
    using R = Result<std::string>;

    if (utils::trim(name).empty()) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "Connection name must not be empty");
    }
    auto prepared = prepare(kind, std::move(fields));
    if (prepared.is_error()) return R::error_from(prepared);
    const auto& config = prepared.value();

    std::string display_name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        display_name = unique_name_locked(name);
        auto pool = make_pool(display_name, config, config.password);
        if (pool.is_error()) return R::error_from(pool);
        configs_[display_name] = config;
        pools_[display_name] = std::move(pool.value());
        persist_locked();
    }
    utils::log::info(std::format("Added connection '{}': {}", display_name, describe_target(config)));
    notify(display_name);
    return R::ok(std::move(display_name));
}

Result<std::string> ConnectionRegistry::update(const std::string& name, std::string_view kind, ParamList fields) {
    using R = Result<std::string>;

    auto prepared = prepare(kind, std::move(fields));
    if (prepared.is_error()) return R::error_from(prepared);
    const auto& config = prepared.value();

    std::shared_ptr<IConnectionPool> old_pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!configs_.contains(name) && !pools_.contains(name)) {
            return R::error(ErrorCategory::NOT_FOUND, std::format("Connection '{}' is not configured", name));
        }
        auto pool = make_pool(name, config, config.password);
        if (pool.is_error()) return R::error_from(pool);
        if (auto it = pools_.find(name); it != pools_.end()) old_pool = std::move(it->second);
        configs_[name] = config;
        pools_[name] = std::move(pool.value());
        persist_locked();
    }
    if (old_pool) old_pool->drain();
    utils::log::info(std::format("Updated connection '{}': {}", name, describe_target(config)));
    notify(name);
    return R::ok(name);
}

// ============================================================================
// Lookup
// ============================================================================

Result<std::shared_ptr<IConnectionPool>> ConnectionRegistry::get(const std::string& name) {
    using R = Result<std::shared_ptr<IConnectionPool>>;

    ConnectionConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = pools_.find(name); it != pools_.end()) {
            return R::ok(it->second);
        }
        auto it = configs_.find(name);
        if (it == configs_.end()) {
            return R::error(ErrorCategory::NOT_FOUND, std::format("Connection '{}' is not configured", name));
        }
        config = it->second;
    }

    // Stored password first, then the rot13 variant left by older stores
    std::vector<std::string> candidates{config.password};
    if (auto alt = utils::rot13(config.password); alt != config.password) {
        candidates.push_back(std::move(alt));
    }

    std::string last_error;
    for (size_t i = 0; i < candidates.size(); ++i) {
        auto pool = make_pool(name, config, candidates[i]);
        if (pool.is_error()) {
            last_error = pool.error_message();
            break;
        }

        const auto probed = probe(pool.value());
        if (probed.is_error()) {
            last_error = probed.error_message();
            utils::log::debug(std::format("Connection test failed for '{}' with password candidate {}/{}: {}",
                                          name, i + 1, candidates.size(), last_error));
            pool.value()->drain();
            continue;
        }

        std::shared_ptr<IConnectionPool> winner;
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto it = pools_.find(name); it != pools_.end()) {
                winner = it->second;
            } else if (configs_.contains(name)) {
                pools_[name] = pool.value();
            } else {
                removed = true;
            }
        }
        if (removed) {
            pool.value()->drain();
            return R::error(ErrorCategory::NOT_FOUND,
                std::format("Connection '{}' was removed while reconnecting", name));
        }
        if (winner) {
            // Another caller reconnected first
            pool.value()->drain();
            return R::ok(std::move(winner));
        }

        utils::log::info(std::format("Reconnected '{}': {}", name, describe_target(config)));
        notify(name);
        return R::ok(std::move(pool.value()));
    }

    utils::log::debug(std::format("All reconnection attempts failed for '{}': {}", name, last_error));
    return R::error(ErrorCategory::UNAVAILABLE,
        std::format("Connection '{}' is not available: {}", name, last_error));
}

std::vector<std::string> ConnectionRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> names;
    for (const auto& [name, _] : configs_) names.insert(name);
    for (const auto& [name, _] : pools_) names.insert(name);
    return {names.begin(), names.end()};
}

void ConnectionRegistry::remove(const std::string& name) {
    std::shared_ptr<IConnectionPool> pool;
    bool had_config = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = pools_.find(name); it != pools_.end()) {
            pool = std::move(it->second);
            pools_.erase(it);
        }
        had_config = configs_.erase(name) > 0;
        if (had_config) persist_locked();
    }
    if (pool) pool->drain();
    if (pool || had_config) {
        utils::log::info(std::format("Removed connection '{}'", name));
        notify(name);
    }
}

Result<ConnectionConfig> ConnectionRegistry::config(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(name);
    if (it == configs_.end()) {
        return Result<ConnectionConfig>::error(ErrorCategory::NOT_FOUND,
            std::format("Connection '{}' is not configured", name));
    }
    auto copy = it->second;
    copy.password.clear();
    return Result<ConnectionConfig>::ok(std::move(copy));
}

// ============================================================================
// Listeners
// ============================================================================

size_t ConnectionRegistry::subscribe(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const auto id = next_listener_id_++;
    listeners_.emplace(id, std::move(callback));
    return id;
}

void ConnectionRegistry::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void ConnectionRegistry::notify(const std::string& name) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [_, cb] : listeners_) callbacks.push_back(cb);
    }
    for (const auto& cb : callbacks) {
        try {
            cb(name);
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Connection change listener failed for '{}': {}", name, e.what()));
        }
    }
}

// ============================================================================
// Helpers (mutex_ held)
// ============================================================================

std::string ConnectionRegistry::unique_name_locked(const std::string& base) const {
    auto taken = [this](const std::string& n) { return configs_.contains(n) || pools_.contains(n); };
    if (!taken(base)) return base;
    for (size_t idx = 1;; ++idx) {
        auto candidate = std::format("{} ({})", base, idx);
        if (!taken(candidate)) return candidate;
    }
}

void ConnectionRegistry::persist_locked() {
    if (!store_->save(configs_)) {
        utils::log::warn("Connection changes could not be written; they will be lost on exit");
    }
}

} // namespace querydesk
