#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace querydesk {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/// Integers in the file may be negative; clamp to 0 so validation reports them
template<typename T>
T unsigned_or(const toml::table& sec, std::string_view key, T fallback) {
    const int64_t v = sec[key].value_or(static_cast<int64_t>(fallback));
    return v < 0 ? T{0} : static_cast<T>(v);
}

} // anonymous namespace

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

std::string ConfigLoader::expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string ConfigLoader::default_path() {
    return expand_home("~/.querydesk/querydesk.toml");
}

// ============================================================================
// Section extractors
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* sec = root["logging"].as_table();
    if (!sec) return cfg;
    cfg.level = (*sec)["level"].value_or(cfg.level);
    cfg.file = expand_home((*sec)["file"].value_or(""s));
    return cfg;
}

StorageConfig ConfigLoader::extract_storage(const toml::table& root) {
    StorageConfig cfg;
    if (const auto* sec = root["storage"].as_table()) {
        cfg.directory = (*sec)["directory"].value_or(cfg.directory);
    }
    cfg.directory = expand_home(cfg.directory);
    return cfg;
}

ExecutionConfig ConfigLoader::extract_execution(const toml::table& root) {
    ExecutionConfig cfg;
    const auto* sec = root["execution"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.row_limit = unsigned_or(s, "row_limit", cfg.row_limit);
    cfg.statement_timeout_ms = unsigned_or(s, "statement_timeout_ms", cfg.statement_timeout_ms);
    cfg.poll_interval_ms = unsigned_or(s, "poll_interval_ms", cfg.poll_interval_ms);
    cfg.acquire_timeout_ms = unsigned_or(s, "acquire_timeout_ms", cfg.acquire_timeout_ms);
    return cfg;
}

PoolSectionConfig ConfigLoader::extract_pool(const toml::table& root) {
    PoolSectionConfig cfg;
    const auto* sec = root["pool"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.max_connections = unsigned_or(s, "max_connections", cfg.max_connections);
    cfg.idle_timeout_ms = unsigned_or(s, "idle_timeout_ms", cfg.idle_timeout_ms);
    cfg.max_lifetime_s = unsigned_or(s, "max_lifetime_s", cfg.max_lifetime_s);
    cfg.health_check_query = s["health_check_query"].value_or(cfg.health_check_query);
    return cfg;
}

RegistrySectionConfig ConfigLoader::extract_registry(const toml::table& root) {
    RegistrySectionConfig cfg;
    if (const auto* sec = root["registry"].as_table()) {
        cfg.probe_timeout_ms = unsigned_or(*sec, "probe_timeout_ms", cfg.probe_timeout_ms);
    }
    return cfg;
}

IntrospectionConfig ConfigLoader::extract_introspection(const toml::table& root) {
    IntrospectionConfig cfg;
    const auto* sec = root["introspection"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.call_timeout_ms = unsigned_or(s, "call_timeout_ms", cfg.call_timeout_ms);
    cfg.cache_ttl_s = unsigned_or(s, "cache_ttl_s", cfg.cache_ttl_s);
    cfg.max_tables = unsigned_or(s, "max_tables", cfg.max_tables);
    cfg.dump_tool = s["dump_tool"].value_or(cfg.dump_tool);
    cfg.dump_timeout_ms = unsigned_or(s, "dump_timeout_ms", cfg.dump_timeout_ms);
    return cfg;
}

AiConfig ConfigLoader::extract_ai(const toml::table& root) {
    AiConfig cfg;
    const auto* sec = root["ai"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.enabled = s["enabled"].value_or(false);
    cfg.base_url = s["base_url"].value_or(""s);
    cfg.model = s["model"].value_or(""s);
    cfg.api_key = s["api_key"].value_or(""s);
    cfg.include_schema = s["include_schema"].value_or(true);
    cfg.timeout_ms = unsigned_or(s, "timeout_ms", cfg.timeout_ms);
    cfg.max_tokens = unsigned_or(s, "max_tokens", cfg.max_tokens);
    cfg.max_retries = unsigned_or(s, "max_retries", cfg.max_retries);
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.logging = extract_logging(root);
    config.storage = extract_storage(root);
    config.execution = extract_execution(root);
    config.pool = extract_pool(root);
    config.registry = extract_registry(root);
    config.introspection = extract_introspection(root);
    config.ai = extract_ai(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        utils::log::debug(std::format("No config at {}, using defaults", config_path));
        return validate_and_return(AppConfig{});
    }
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    if (config.execution.row_limit == 0) {
        errors.push_back("execution.row_limit must be > 0");
    }
    if (config.execution.statement_timeout_ms == 0) {
        errors.push_back("execution.statement_timeout_ms must be > 0");
    }
    if (config.execution.poll_interval_ms == 0) {
        errors.push_back("execution.poll_interval_ms must be > 0");
    }
    if (config.execution.acquire_timeout_ms == 0) {
        errors.push_back("execution.acquire_timeout_ms must be > 0");
    }

    if (config.pool.max_connections == 0) {
        errors.push_back("pool.max_connections must be > 0");
    }
    if (config.pool.idle_timeout_ms == 0) {
        errors.push_back("pool.idle_timeout_ms must be > 0");
    }

    if (config.registry.probe_timeout_ms == 0) {
        errors.push_back("registry.probe_timeout_ms must be > 0");
    }

    if (config.introspection.call_timeout_ms == 0) {
        errors.push_back("introspection.call_timeout_ms must be > 0");
    }
    if (config.introspection.dump_timeout_ms == 0) {
        errors.push_back("introspection.dump_timeout_ms must be > 0");
    }
    if (config.introspection.max_tables == 0) {
        errors.push_back("introspection.max_tables must be > 0");
    }

    if (config.ai.enabled) {
        if (config.ai.base_url.empty()) {
            errors.push_back("ai.base_url required when ai is enabled");
        }
        if (config.ai.timeout_ms == 0) {
            errors.push_back("ai.timeout_ms must be > 0");
        }
    }

    return errors;
}

} // namespace querydesk
