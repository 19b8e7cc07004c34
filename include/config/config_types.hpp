#pragma once

#include <cstdint>
#include <string>

namespace querydesk {

// ============================================================================
// Configuration Types (mirror the querydesk.toml sections)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
    std::string file;               // empty = stderr only
};

struct StorageConfig {
    std::string directory = "~/.querydesk";   // connections.json, app_state.json
};

struct ExecutionConfig {
    size_t row_limit = 1000;
    uint32_t statement_timeout_ms = 30000;
    uint32_t poll_interval_ms = 50;
    uint32_t acquire_timeout_ms = 5000;
};

struct PoolSectionConfig {
    size_t max_connections = 4;
    uint32_t idle_timeout_ms = 300000;
    uint32_t max_lifetime_s = 3600;
    std::string health_check_query = "SELECT 1";
};

struct RegistrySectionConfig {
    uint32_t probe_timeout_ms = 5000;
};

struct IntrospectionConfig {
    uint32_t call_timeout_ms = 5000;
    uint32_t cache_ttl_s = 60;
    size_t max_tables = 50;
    std::string dump_tool = "pg_dump";
    uint32_t dump_timeout_ms = 20000;
};

struct AiConfig {
    bool enabled = false;
    std::string base_url;
    std::string model;
    std::string api_key;            // env var name or literal key
    bool include_schema = true;
    uint32_t timeout_ms = 15000;
    uint32_t max_tokens = 1024;
    uint32_t max_retries = 2;
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    LoggingConfig logging;
    StorageConfig storage;
    ExecutionConfig execution;
    PoolSectionConfig pool;
    RegistrySectionConfig registry;
    IntrospectionConfig introspection;
    AiConfig ai;
};

} // namespace querydesk
