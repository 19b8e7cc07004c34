#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace querydesk {

// ============================================================================
// ConfigLoader - Extract typed config from querydesk.toml
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to querydesk.toml; a missing file yields defaults
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every violated constraint, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

    /// ~/.querydesk/querydesk.toml
    [[nodiscard]] static std::string default_path();

    /// Expand a leading "~" with $HOME
    [[nodiscard]] static std::string expand_home(const std::string& path);

    /// Expand ${VAR_NAME} references; unset variables expand to nothing
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static StorageConfig extract_storage(const toml::table& root);
    static ExecutionConfig extract_execution(const toml::table& root);
    static PoolSectionConfig extract_pool(const toml::table& root);
    static RegistrySectionConfig extract_registry(const toml::table& root);
    static IntrospectionConfig extract_introspection(const toml::table& root);
    static AiConfig extract_ai(const toml::table& root);

    static AppConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace querydesk
