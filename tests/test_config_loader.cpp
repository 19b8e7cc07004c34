#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "mocks/temp_dir.hpp"

#include <algorithm>
#include <cstdlib>

using namespace querydesk;
using namespace querydesk::testing;

namespace {

bool has_error(const std::vector<std::string>& errors, std::string_view fragment) {
    return std::any_of(errors.begin(), errors.end(),
        [fragment](const std::string& e) { return e.find(fragment) != std::string::npos; });
}

} // namespace

TEST_CASE("Config: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& c = result.config;
    CHECK(c.logging.level == "info");
    CHECK(c.execution.row_limit == 1000);
    CHECK(c.execution.statement_timeout_ms == 30000);
    CHECK(c.pool.max_connections == 4);
    CHECK(c.pool.health_check_query == "SELECT 1");
    CHECK(c.registry.probe_timeout_ms == 5000);
    CHECK(c.introspection.max_tables == 50);
    CHECK(c.introspection.dump_tool == "pg_dump");
    CHECK_FALSE(c.ai.enabled);
    CHECK(c.ai.include_schema);
}

TEST_CASE("Config: sections override defaults", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[storage]
directory = "/var/lib/querydesk"

[execution]
row_limit = 250
statement_timeout_ms = 1500

[pool]
max_connections = 2
max_lifetime_s = 0
health_check_query = "SELECT 2"

[introspection]
cache_ttl_s = 5
max_tables = 10
dump_tool = "/opt/pg/bin/pg_dump"

[ai]
enabled = true
base_url = "http://localhost:11434/v1"
model = "sqlcoder"
api_key = "OPENAI_API_KEY"
max_retries = 0
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& c = result.config;
    CHECK(c.logging.level == "debug");
    CHECK(c.storage.directory == "/var/lib/querydesk");
    CHECK(c.execution.row_limit == 250);
    CHECK(c.execution.statement_timeout_ms == 1500);
    CHECK(c.execution.poll_interval_ms == 50);
    CHECK(c.pool.max_connections == 2);
    CHECK(c.pool.max_lifetime_s == 0);
    CHECK(c.pool.health_check_query == "SELECT 2");
    CHECK(c.introspection.cache_ttl_s == 5);
    CHECK(c.introspection.max_tables == 10);
    CHECK(c.introspection.dump_tool == "/opt/pg/bin/pg_dump");
    CHECK(c.ai.enabled);
    CHECK(c.ai.model == "sqlcoder");
    CHECK(c.ai.api_key == "OPENAI_API_KEY");
    CHECK(c.ai.max_retries == 0);
}

TEST_CASE("Config: environment references", "[config][env]") {
    ::setenv("QD_TEST_AI_URL", "https://llm.internal", 1);
    ::unsetenv("QD_TEST_UNSET_XYZ");

    auto result = ConfigLoader::load_from_string(R"(
[ai]
enabled = true
base_url = "${QD_TEST_AI_URL}/v1"
model = "m${QD_TEST_UNSET_XYZ}"
)");
    REQUIRE(result.success);
    CHECK(result.config.ai.base_url == "https://llm.internal/v1");
    CHECK(result.config.ai.model == "m");

    auto unclosed = ConfigLoader::load_from_string(R"(
[ai]
base_url = "${QD_TEST_AI_URL"
)");
    CHECK_FALSE(unclosed.success);
    CHECK(unclosed.error_message.find("Unclosed") != std::string::npos);

    ::unsetenv("QD_TEST_AI_URL");
}

TEST_CASE("Config: home expansion", "[config]") {
    ::setenv("HOME", "/home/tester", 1);
    CHECK(ConfigLoader::expand_home("~/.querydesk") == "/home/tester/.querydesk");
    CHECK(ConfigLoader::expand_home("~other/x") == "~other/x");
    CHECK(ConfigLoader::expand_home("/abs") == "/abs");
    CHECK(ConfigLoader::default_path() == "/home/tester/.querydesk/querydesk.toml");

    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.storage.directory == "/home/tester/.querydesk");
}

TEST_CASE("Config: validation reports every problem", "[config][validation]") {
    AppConfig config;
    config.logging.level = "verbose";
    config.execution.row_limit = 0;
    config.execution.statement_timeout_ms = 0;
    config.pool.max_connections = 0;
    config.introspection.call_timeout_ms = 0;
    config.ai.enabled = true;

    const auto errors = ConfigLoader::validate_config(config);
    CHECK(errors.size() == 6);
    CHECK(has_error(errors, "logging.level"));
    CHECK(has_error(errors, "execution.row_limit"));
    CHECK(has_error(errors, "execution.statement_timeout_ms"));
    CHECK(has_error(errors, "pool.max_connections"));
    CHECK(has_error(errors, "introspection.call_timeout_ms"));
    CHECK(has_error(errors, "ai.base_url"));

    CHECK(ConfigLoader::validate_config(AppConfig{}).empty());
}

TEST_CASE("Config: invalid documents fail to load", "[config][validation]") {
    SECTION("validation failure lists each error") {
        auto result = ConfigLoader::load_from_string(R"(
[execution]
row_limit = 0
[pool]
max_connections = -3
)");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.starts_with("Config validation failed:"));
        CHECK(result.error_message.find("\n  - execution.row_limit must be > 0") != std::string::npos);
        CHECK(result.error_message.find("\n  - pool.max_connections must be > 0") != std::string::npos);
    }

    SECTION("syntax error") {
        auto result = ConfigLoader::load_from_string("[execution\nrow_limit = 5");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.starts_with("Failed to parse config"));
    }
}

TEST_CASE("Config: files", "[config]") {
    TempDir dir;

    SECTION("missing file uses defaults") {
        auto result = ConfigLoader::load_from_file(dir.file("absent.toml"));
        REQUIRE(result.success);
        CHECK(result.config.execution.row_limit == 1000);
    }

    SECTION("file on disk") {
        const auto path = dir.write("querydesk.toml", "[registry]\nprobe_timeout_ms = 750\n");
        auto result = ConfigLoader::load_from_file(path);
        REQUIRE(result.success);
        CHECK(result.config.registry.probe_timeout_ms == 750);
    }

    SECTION("broken file") {
        const auto path = dir.write("querydesk.toml", "level = = 3\n");
        auto result = ConfigLoader::load_from_file(path);
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.starts_with("Failed to load config"));
    }
}
