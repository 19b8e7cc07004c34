#include "schema/schema_introspector.hpp"
#include "core/deadline.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include "db/catalog_util.hpp"
#include "db/pooled_connection.hpp"
#include "registry/connection_registry.hpp"

#include <algorithm>
#include <format>
#include <sstream>
#include <utility>

namespace querydesk {

namespace {

std::string bracket_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    out += "]";
    return out;
}

void append_indented(std::string& out, const std::string& text, std::string_view indent) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        out += indent;
        out += line;
        out += '\n';
    }
}

std::shared_ptr<ICatalogReader> registered_reader(DatabaseType type, const std::string& dump_tool) {
    auto& registry = BackendRegistry::instance();
    if (!registry.has_backend(type)) return nullptr;
    return registry.create(type)->create_catalog_reader(CatalogOptions{dump_tool});
}

} // anonymous namespace

SchemaIntrospector::SchemaIntrospector(IConnectionSource& source,
                                       IntrospectorConfig config,
                                       CatalogResolver resolver)
    : source_(source),
      config_(std::move(config)),
      resolver_(std::move(resolver)) {
    if (!resolver_) {
        resolver_ = [tool = config_.dump_tool](DatabaseType type) {
            return registered_reader(type, tool);
        };
    }
}

// ============================================================================
// Plumbing
// ============================================================================

Result<SchemaIntrospector::Target> SchemaIntrospector::resolve(const std::string& connection) {
    auto pool = source_.get(connection);
    if (pool.is_error()) {
        return Result<Target>::error_from(pool);
    }
    auto reader = resolver_(pool.value()->type());
    if (!reader) {
        return Result<Target>::error(ErrorCategory::UNAVAILABLE,
            std::format("No catalog reader for {}", database_type_to_string(pool.value()->type())));
    }
    return Result<Target>::ok(Target{std::move(pool.value()), std::move(reader)});
}

template<typename T>
Result<T> SchemaIntrospector::bounded(const Target& target, CatalogCall<T> call,
                                      std::string_view what) const {
    // The worker may outlive this call on timeout, so it owns everything it touches
    auto work = [pool = target.pool, reader = target.reader, call = std::move(call),
                 acquire_timeout = config_.acquire_timeout]() -> Result<T> {
        auto conn = pool->acquire(acquire_timeout);
        if (!conn) {
            return Result<T>::error(ErrorCategory::UNAVAILABLE, pool->last_error());
        }
        return call(*reader, *conn->get());
    };
    return run_with_deadline<T>(std::move(work), config_.call_timeout, what);
}

// ============================================================================
// describe
// ============================================================================

std::string SchemaIntrospector::describe(const std::string& connection) {
    auto target = resolve(connection);
    if (target.is_error()) {
        utils::log::debug(std::format("describe '{}': {}", connection, target.error_message()));
        return {};
    }
    const auto& t = target.value();
    const auto now = std::chrono::steady_clock::now();

    {
        std::lock_guard lock(cache_mutex_);
        const auto it = cache_.find(t.pool.get());
        if (it != cache_.end()) {
            if (it->second.pool.lock() == t.pool && now - it->second.stored_at < config_.cache_ttl) {
                return it->second.text;
            }
            cache_.erase(it);
        }
    }

    auto tables = bounded<std::vector<std::string>>(t,
        [](ICatalogReader& r, IDbConnection& c) { return r.table_names(c); }, "list tables");
    auto views = bounded<std::vector<std::string>>(t,
        [](ICatalogReader& r, IDbConnection& c) { return r.view_names(c); }, "list views");

    if (tables.is_error()) {
        utils::log::warn(std::format("describe '{}': {}", connection, tables.error_message()));
    }
    if (views.is_error()) {
        utils::log::debug(std::format("describe '{}': views: {}", connection, views.error_message()));
    }
    const bool has_tables = tables.is_ok() && !tables.value().empty();
    const bool has_views = views.is_ok() && !views.value().empty();
    if (!has_tables && !has_views) {
        return {};
    }

    std::string out = std::format("Connection dialect: {}\n", database_type_to_string(t.pool->type()));

    if (has_tables) {
        const auto& names = tables.value();
        const size_t shown = std::min(names.size(), config_.max_tables);
        out += "Tables:\n";
        for (size_t i = 0; i < shown; ++i) {
            const auto& table = names[i];
            out += std::format("- {}\n", table);

            auto columns = bounded<std::vector<ColumnInfo>>(t,
                [table](ICatalogReader& r, IDbConnection& c) { return r.columns(c, table); },
                "columns of " + table);
            if (columns.is_error()) {
                out += "  (failed to introspect columns)\n";
                continue;
            }
            for (const auto& col : columns.value()) {
                out += std::format("  - {}: {}, nullable={}, default={}\n",
                    col.name, col.type, col.nullable ? "true" : "false",
                    col.default_value.value_or("none"));
            }

            auto pk = bounded<std::vector<std::string>>(t,
                [table](ICatalogReader& r, IDbConnection& c) { return r.primary_key(c, table); },
                "primary key of " + table);
            if (pk.is_ok() && !pk.value().empty()) {
                out += std::format("  Primary key: {}\n", bracket_list(pk.value()));
            }

            auto fks = bounded<std::vector<ForeignKeyInfo>>(t,
                [table](ICatalogReader& r, IDbConnection& c) { return r.foreign_keys(c, table); },
                "foreign keys of " + table);
            if (fks.is_ok()) {
                for (const auto& fk : fks.value()) {
                    out += std::format("  FK: columns={} -> {}.{}\n",
                        bracket_list(fk.columns), fk.referred_table, bracket_list(fk.referred_columns));
                }
            }

            auto indexes = bounded<std::vector<IndexInfo>>(t,
                [table](ICatalogReader& r, IDbConnection& c) { return r.indexes(c, table); },
                "indexes of " + table);
            if (indexes.is_ok()) {
                for (const auto& idx : indexes.value()) {
                    out += std::format("  Index: {} columns={} unique={}\n",
                        idx.name, bracket_list(idx.columns), idx.unique ? "true" : "false");
                }
            }

            auto ddl = bounded<std::string>(t,
                [table, cols = columns.value(),
                 keys = pk.is_ok() ? pk.value() : std::vector<std::string>{},
                 refs = fks.is_ok() ? fks.value() : std::vector<ForeignKeyInfo>{}](
                    ICatalogReader&, IDbConnection& c) {
                    return Result<std::string>::ok(reflected_ddl(c, table, cols, keys, refs));
                }, "DDL of " + table);
            if (ddl.is_ok() && !ddl.value().empty()) {
                out += "  CREATE:\n";
                append_indented(out, ddl.value(), "    ");
            }
        }
        if (names.size() > shown) {
            out += std::format("... (table list truncated to first {} tables)\n", config_.max_tables);
        }
    }

    if (has_views) {
        out += "Views:\n";
        for (const auto& view : views.value()) {
            out += std::format("- {}\n", view);
            auto def = bounded<std::string>(t,
                [view](ICatalogReader& r, IDbConnection& c) { return r.view_definition(c, view); },
                "definition of " + view);
            if (def.is_ok() && !utils::trim(def.value()).empty()) {
                out += "  Definition:\n";
                append_indented(out, def.value(), "    ");
            } else {
                out += "  (view definition not available)\n";
            }
        }
    }

    std::lock_guard lock(cache_mutex_);
    cache_[t.pool.get()] = CacheEntry{connection, t.pool, now, out};
    return out;
}

// ============================================================================
// Columns and keys
// ============================================================================

std::map<std::string, std::vector<std::string>> SchemaIntrospector::table_columns(const std::string& connection) {
    std::map<std::string, std::vector<std::string>> out;
    auto target = resolve(connection);
    if (target.is_error()) return out;
    const auto& t = target.value();

    auto tables = bounded<std::vector<std::string>>(t,
        [](ICatalogReader& r, IDbConnection& c) { return r.table_names(c); }, "list tables");
    if (tables.is_error()) {
        utils::log::warn(std::format("table_columns '{}': {}", connection, tables.error_message()));
        return out;
    }

    for (const auto& table : tables.value()) {
        auto columns = bounded<std::vector<ColumnInfo>>(t,
            [table](ICatalogReader& r, IDbConnection& c) { return r.columns(c, table); },
            "columns of " + table);
        auto& names = out[table];
        if (columns.is_error()) continue;
        for (const auto& col : columns.value()) names.push_back(col.name);
    }
    return out;
}

std::vector<std::string> SchemaIntrospector::primary_key_columns(const std::string& connection,
                                                                 const std::string& table) {
    auto target = resolve(connection);
    if (target.is_error()) return {};
    auto pk = bounded<std::vector<std::string>>(target.value(),
        [table](ICatalogReader& r, IDbConnection& c) { return r.primary_key(c, table); },
        "primary key of " + table);
    if (pk.is_error()) {
        utils::log::debug(std::format("primary key of {}: {}", table, pk.error_message()));
        return {};
    }
    return std::move(pk.value());
}

// ============================================================================
// DDL
// ============================================================================

std::string SchemaIntrospector::reflected_ddl(const IDbConnection& conn,
                                              const std::string& table,
                                              const std::vector<ColumnInfo>& columns,
                                              const std::vector<std::string>& primary_key,
                                              const std::vector<ForeignKeyInfo>& foreign_keys) {
    if (columns.empty()) return {};

    std::vector<std::string> lines;
    for (const auto& col : columns) {
        std::string line = conn.quote_identifier(col.name) + " " + col.type;
        if (!col.nullable) line += " NOT NULL";
        if (col.default_value) line += " DEFAULT " + *col.default_value;
        lines.push_back(std::move(line));
    }

    auto quoted_list = [&conn](const std::vector<std::string>& names) {
        std::string out;
        for (const auto& n : names) {
            if (!out.empty()) out += ", ";
            out += conn.quote_identifier(n);
        }
        return out;
    };

    if (!primary_key.empty()) {
        lines.push_back("PRIMARY KEY (" + quoted_list(primary_key) + ")");
    }
    for (const auto& fk : foreign_keys) {
        std::string line = fk.name.empty() ? "" : "CONSTRAINT " + conn.quote_identifier(fk.name) + " ";
        line += "FOREIGN KEY(" + quoted_list(fk.columns) + ") REFERENCES " +
                catalog::quote_qualified(conn, fk.referred_table) +
                " (" + quoted_list(fk.referred_columns) + ")";
        lines.push_back(std::move(line));
    }

    std::string out = "CREATE TABLE " + catalog::quote_qualified(conn, table) + " (\n";
    for (size_t i = 0; i < lines.size(); ++i) {
        out += "\t" + lines[i];
        out += (i + 1 < lines.size()) ? ",\n" : "\n";
    }
    out += ")";
    return out;
}

std::string SchemaIntrospector::create_statement_for(const Target& t, const std::string& table) const {
    auto reflected = bounded<std::string>(t,
        [table](ICatalogReader& r, IDbConnection& c) -> Result<std::string> {
            auto columns = r.columns(c, table);
            if (columns.is_error()) return Result<std::string>::error_from(columns);
            auto pk = r.primary_key(c, table);
            auto fks = r.foreign_keys(c, table);
            return Result<std::string>::ok(reflected_ddl(c, table, columns.value(),
                pk.is_ok() ? pk.value() : std::vector<std::string>{},
                fks.is_ok() ? fks.value() : std::vector<ForeignKeyInfo>{}));
        }, "reflect " + table);
    if (reflected.is_ok() && !reflected.value().empty()) {
        return std::move(reflected.value());
    }

    auto native = bounded<std::string>(t,
        [table](ICatalogReader& r, IDbConnection& c) { return r.native_create_statement(c, table); },
        "native DDL of " + table);
    if (native.is_ok() && !native.value().empty()) {
        return std::move(native.value());
    }

    auto dumped = t.reader->dump_create_statement(t.pool->target(), table, config_.dump_timeout);
    if (dumped.is_ok() && !dumped.value().empty()) {
        return std::move(dumped.value());
    }

    utils::log::debug(std::format("No DDL for {}: {}", table,
        native.is_error() ? native.error_message() : dumped.error_message()));
    return {};
}

std::string SchemaIntrospector::create_statement(const std::string& connection, const std::string& table) {
    auto target = resolve(connection);
    if (target.is_error()) return {};
    return create_statement_for(target.value(), table);
}

std::string SchemaIntrospector::create_statements_for_connection(const std::string& connection) {
    auto target = resolve(connection);
    if (target.is_error()) return {};
    const auto& t = target.value();

    if (t.pool->type() == DatabaseType::POSTGRESQL) {
        auto dumped = t.reader->dump_create_statement(t.pool->target(), "", config_.dump_timeout);
        if (dumped.is_ok() && !utils::trim(dumped.value()).empty()) {
            return std::move(dumped.value());
        }
        utils::log::debug(std::format("Schema dump for '{}' unavailable: {}", connection,
            dumped.is_error() ? dumped.error_message() : "empty output"));
    }

    auto tables = bounded<std::vector<std::string>>(t,
        [](ICatalogReader& r, IDbConnection& c) { return r.table_names(c); }, "list tables");
    if (tables.is_error()) return {};

    std::string out;
    for (const auto& table : tables.value()) {
        auto ddl = create_statement_for(t, table);
        if (ddl.empty()) continue;
        if (!out.empty()) out += "\n\n";
        out += std::format("-- CREATE for table {}\n{}", table, ddl);
    }
    return out;
}

// ============================================================================
// Cache
// ============================================================================

void SchemaIntrospector::invalidate(const std::string& connection) {
    std::lock_guard lock(cache_mutex_);
    std::erase_if(cache_, [&connection](const auto& entry) {
        return entry.second.name == connection || entry.second.pool.expired();
    });
}

void SchemaIntrospector::invalidate_all() {
    std::lock_guard lock(cache_mutex_);
    cache_.clear();
}

} // namespace querydesk
