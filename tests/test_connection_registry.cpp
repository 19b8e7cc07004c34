#include <catch2/catch_test_macros.hpp>
#include "registry/connection_registry.hpp"
#include "core/utils.hpp"
#include "db/pooled_connection.hpp"
#include "mocks/mock_database.hpp"
#include "mocks/temp_dir.hpp"
#include "registry/json_connection_store.hpp"

#ifdef ENABLE_SQLITE
#include "db/sqlite/sqlite_backend.hpp"
#endif

#include <algorithm>

using namespace querydesk;
using namespace querydesk::testing;

namespace {

struct Fixture {
    std::shared_ptr<MockDatabase> db = std::make_shared<MockDatabase>();
    std::shared_ptr<InMemoryConnectionStore> store = std::make_shared<InMemoryConnectionStore>();

    std::unique_ptr<ConnectionRegistry> make() {
        RegistryConfig config;
        config.probe_timeout = std::chrono::milliseconds{500};
        return std::make_unique<ConnectionRegistry>(store, config, mock_resolver(db));
    }
};

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

ConnectionConfig stored_pg(std::string password) {
    ConnectionConfig config;
    config.kind = DatabaseType::POSTGRESQL;
    config.driver = "libpq";
    config.host = "db.internal";
    config.port = 5432;
    config.user = "alice";
    config.password = std::move(password);
    config.database = "sales";
    return config;
}

} // namespace

TEST_CASE("Registry: add registers and persists without connecting", "[registry]") {
    Fixture f;
    auto registry = f.make();

    const auto added = registry->add("Sales", "postgresql",
        {{"host", "db.internal"}, {"port", "6543"}, {"user", "alice"}, {"password", "s3cret"}, {"database", "sales"}});
    REQUIRE(added.is_ok());
    CHECK(added.value() == "Sales");

    CHECK(contains(registry->list(), "Sales"));
    CHECK(f.db->opened == 0);
    REQUIRE(f.store->data.contains("Sales"));

    const auto& saved = f.store->data.at("Sales");
    CHECK(saved.kind == DatabaseType::POSTGRESQL);
    CHECK(saved.driver == "libpq");
    CHECK(saved.port == 6543);
    CHECK(saved.password == "s3cret");
}

TEST_CASE("Registry: colliding names get a numeric suffix", "[registry]") {
    Fixture f;
    auto registry = f.make();

    REQUIRE(registry->add("Local", "pg", {}).value() == "Local");
    REQUIRE(registry->add("Local", "mysql", {}).value() == "Local (1)");
    REQUIRE(registry->add("Local", "mysql", {}).value() == "Local (2)");
    CHECK(registry->list().size() == 3);
}

TEST_CASE("Registry: defaults and validation", "[registry]") {
    Fixture f;
    auto registry = f.make();

    SECTION("host and port defaults per kind") {
        REQUIRE(registry->add("pg", "postgres", {{"database", "app"}}).is_ok());
        REQUIRE(registry->add("my", "mariadb", {{"database", "app"}}).is_ok());
        CHECK(f.store->data.at("pg").host == "localhost");
        CHECK(f.store->data.at("pg").port == 5432);
        CHECK(f.store->data.at("my").port == 3306);
        CHECK(f.store->data.at("my").driver == "mysqlclient");
    }

    SECTION("bad port") {
        for (const auto* port : {"0", "70000", "abc"}) {
            const auto r = registry->add("x", "postgresql", {{"port", port}});
            REQUIRE(r.is_error());
            CHECK(r.error_category() == ErrorCategory::VALIDATION_ERROR);
        }
    }

    SECTION("unsupported kind") {
        const auto r = registry->add("x", "oracle", {});
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION_ERROR);
    }

    SECTION("empty name") {
        const auto r = registry->add("  ", "postgresql", {});
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION_ERROR);
    }

    SECTION("malformed descriptor") {
        const auto r = registry->add("x", "postgresql", {{"jdbc", "postgresql://nope"}});
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::PARSE_ERROR);
    }

    SECTION("invalid parameter name") {
        const auto r = registry->add("x", "postgresql", {{"bad key!", "1"}});
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION_ERROR);
    }

    CHECK_FALSE(contains(registry->list(), "x"));
}

TEST_CASE("Registry: descriptor fills fields the caller left open", "[registry]") {
    Fixture f;
    auto registry = f.make();

    const auto r = registry->add("Reporting", "mysql", {
        {"jdbc", "jdbc:postgresql://bob:pw@pg.example.com:5433/warehouse?currentSchema=mart&ssl=false"},
        {"username", "carol"},
        {"connect_timeout", "10"},
    });
    REQUIRE(r.is_ok());

    const auto& saved = f.store->data.at("Reporting");
    CHECK(saved.kind == DatabaseType::POSTGRESQL);
    CHECK(saved.host == "pg.example.com");
    CHECK(saved.port == 5433);
    CHECK(saved.database == "warehouse");
    CHECK(saved.user == "carol");
    CHECK(saved.password == "pw");
    REQUIRE(saved.schema.has_value());
    CHECK(*saved.schema == "mart");
    CHECK(saved.params.get("sslmode") == "disable");
    CHECK(saved.params.get("connect_timeout") == "10");
    CHECK(saved.params.get("options") == "-c search_path=mart");
}

TEST_CASE("Registry: schema is applied on every new session", "[registry]") {
    Fixture f;
    auto registry = f.make();
    REQUIRE(registry->add("Warehouse", "postgresql", {{"search_path", "mart,public"}}).is_ok());

    auto pool = registry->get("Warehouse");
    REQUIRE(pool.is_ok());
    auto conn = pool.value()->acquire();
    REQUIRE(conn != nullptr);

    const auto statements = f.db->statements();
    REQUIRE_FALSE(statements.empty());
    CHECK(statements.front() == R"(SET search_path TO "mart", "public")");
}

TEST_CASE("Registry: add then remove leaves no stale handle", "[registry]") {
    Fixture f;
    auto registry = f.make();
    REQUIRE(registry->add("Temp", "postgresql", {}).is_ok());
    REQUIRE(registry->get("Temp").is_ok());

    registry->remove("Temp");
    CHECK_FALSE(contains(registry->list(), "Temp"));
    CHECK_FALSE(f.store->data.contains("Temp"));

    const auto again = registry->get("Temp");
    REQUIRE(again.is_error());
    CHECK((again.error_category() == ErrorCategory::NOT_FOUND ||
           again.error_category() == ErrorCategory::UNAVAILABLE));

    // Removing an absent name is a no-op
    const int saves = f.store->saves;
    registry->remove("Temp");
    CHECK(f.store->saves == saves);
}

TEST_CASE("Registry: get reconstructs a stored connection", "[registry]") {
    Fixture f;
    f.store->data["Sales"] = stored_pg("s3cret");
    auto registry = f.make();

    CHECK(registry->list() == std::vector<std::string>{"Sales"});

    auto pool = registry->get("Sales");
    REQUIRE(pool.is_ok());
    CHECK(pool.value()->name() == "Sales");
    CHECK(f.db->opened == 1);

    // Cached afterwards
    auto again = registry->get("Sales");
    REQUIRE(again.is_ok());
    CHECK(again.value() == pool.value());
}

TEST_CASE("Registry: falls back to the rot13 password candidate", "[registry]") {
    Fixture f;
    f.store->data["Legacy"] = stored_pg("frperg");   // rot13("secret")
    f.db->accept = [](const std::string& target) {
        return target.find("password='secret'") != std::string::npos;
    };
    auto registry = f.make();

    auto pool = registry->get("Legacy");
    REQUIRE(pool.is_ok());

    const auto targets = f.db->connect_targets();
    REQUIRE(targets.size() == 2);
    CHECK(targets[0].find("password='frperg'") != std::string::npos);
    CHECK(targets[1].find("password='secret'") != std::string::npos);
}

TEST_CASE("Registry: unreachable connection reports the last driver error", "[registry]") {
    Fixture f;
    f.store->data["Down"] = stored_pg("pw");
    f.db->accept = [](const std::string&) { return false; };
    f.db->reject_message = "could not connect to server: Connection refused";
    auto registry = f.make();

    const auto r = registry->get("Down");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::UNAVAILABLE);
    CHECK(r.error_message().find("Down") != std::string::npos);
    CHECK(r.error_message().find("Connection refused") != std::string::npos);
    CHECK(f.db->connect_targets().size() == 2);
}

TEST_CASE("Registry: reconnect requires a query round trip", "[registry]") {
    Fixture f;
    f.store->data["Sales"] = stored_pg("s3cret");

    SECTION("the health query is executed") {
        auto registry = f.make();
        REQUIRE(registry->get("Sales").is_ok());
        const auto statements = f.db->statements();
        CHECK(std::find(statements.begin(), statements.end(), "SELECT 1") != statements.end());
    }

    SECTION("a connection that cannot answer is UNAVAILABLE and not cached") {
        f.db->handler = [](const std::string& sql, const std::vector<Cell>&) {
            return sql == "SELECT 1" ? failed("server closed the connection unexpectedly") : ok_affected(0);
        };
        auto registry = f.make();

        const auto r = registry->get("Sales");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::UNAVAILABLE);
        CHECK(r.error_message().find("server closed the connection") != std::string::npos);

        f.db->handler = nullptr;
        REQUIRE(registry->get("Sales").is_ok());
    }
}

TEST_CASE("Registry: unknown name is NOT_FOUND", "[registry]") {
    Fixture f;
    auto registry = f.make();
    const auto r = registry->get("nope");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::NOT_FOUND);
}

TEST_CASE("Registry: add_file registers SQLite files by file name", "[registry]") {
    Fixture f;
    TempDir dir;
    const auto path = dir.write("shop.db", "");
    auto registry = f.make();

    const auto first = registry->add_file(path);
    REQUIRE(first.is_ok());
    CHECK(first.value() == "SQLite: shop.db");
    CHECK(registry->add_file(path).value() == "SQLite: shop.db (1)");

    const auto& saved = f.store->data.at("SQLite: shop.db");
    CHECK(saved.kind == DatabaseType::SQLITE);
    CHECK(saved.path == path);

    const auto missing = registry->add_file(dir.file("missing.db"));
    REQUIRE(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::NOT_FOUND);
}

TEST_CASE("Registry: update replaces the record in place", "[registry]") {
    Fixture f;
    auto registry = f.make();
    REQUIRE(registry->add("Sales", "postgresql", {{"host", "old.example.com"}}).is_ok());
    auto old_pool = registry->get("Sales").value();

    const auto r = registry->update("Sales", "postgresql", {{"host", "new.example.com"}, {"password", "pw"}});
    REQUIRE(r.is_ok());
    CHECK(r.value() == "Sales");
    CHECK(f.store->data.at("Sales").host == "new.example.com");

    auto new_pool = registry->get("Sales").value();
    CHECK(new_pool != old_pool);
    CHECK(old_pool->acquire(std::chrono::milliseconds{10}) == nullptr);

    const auto missing = registry->update("Ghost", "postgresql", {});
    REQUIRE(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::NOT_FOUND);
}

TEST_CASE("Registry: config hides the password", "[registry]") {
    Fixture f;
    auto registry = f.make();
    REQUIRE(registry->add("Sales", "postgresql", {{"pwd", "hunter2"}}).is_ok());
    CHECK(f.store->data.at("Sales").password == "hunter2");

    const auto config = registry->config("Sales");
    REQUIRE(config.is_ok());
    CHECK(config.value().password.empty());
}

TEST_CASE("Registry: listeners hear about every change", "[registry]") {
    Fixture f;
    auto registry = f.make();
    std::vector<std::string> seen;
    const auto id = registry->subscribe([&seen](const std::string& name) { seen.push_back(name); });

    REQUIRE(registry->add("A", "postgresql", {}).is_ok());
    REQUIRE(registry->update("A", "postgresql", {{"host", "h"}}).is_ok());
    registry->remove("A");
    CHECK(seen == std::vector<std::string>{"A", "A", "A"});

    registry->unsubscribe(id);
    REQUIRE(registry->add("B", "postgresql", {}).is_ok());
    CHECK(seen.size() == 3);
}

TEST_CASE("Registry: targets", "[registry]") {
    SECTION("postgres conninfo quotes values") {
        auto config = stored_pg("it's");
        config.params.set("sslmode", "disable");
        CHECK(ConnectionRegistry::build_target(config, config.password) ==
              R"(host='db.internal' port='5432' dbname='sales' user='alice' password='it\'s' sslmode='disable')");
        CHECK(ConnectionRegistry::describe_target(config).find("password='***'") != std::string::npos);
    }

    SECTION("mysql uri percent-encodes credentials") {
        ConnectionConfig config;
        config.kind = DatabaseType::MYSQL;
        config.host = "::1";
        config.port = 3307;
        config.user = "bob";
        config.database = "shop";
        CHECK(ConnectionRegistry::build_target(config, "p@ss") == "mysql://bob:p%40ss@[::1]:3307/shop");
    }

    SECTION("sqlite uses the path") {
        ConnectionConfig config;
        config.kind = DatabaseType::SQLITE;
        config.path = "/data/app.db";
        CHECK(ConnectionRegistry::build_target(config, "") == "/data/app.db");
    }
}

TEST_CASE("Registry: non-UTF-8 file names do not break registration", "[registry]") {
    Fixture f;
    TempDir dir;
    const auto path = dir.write("caf\xE9.db", "");
    auto store = std::make_shared<JsonConnectionStore>(dir.file("connections.json"));
    RegistryConfig config;
    config.probe_timeout = std::chrono::milliseconds{500};
    ConnectionRegistry registry(store, config, mock_resolver(f.db));

    const auto added = registry.add_file(path);
    REQUIRE(added.is_ok());
    CHECK(added.value() == "SQLite: caf\xE9.db");
    CHECK(contains(registry.list(), added.value()));
    CHECK(registry.get(added.value()).is_ok());
}

#ifdef ENABLE_SQLITE
TEST_CASE("Registry: a file that is not a database is UNAVAILABLE", "[registry][sqlite]") {
    TempDir dir;
    auto store = std::make_shared<InMemoryConnectionStore>();
    ConnectionConfig notes;
    notes.kind = DatabaseType::SQLITE;
    notes.driver = "sqlite3";
    notes.path = dir.write("notes.db", std::string(64, '#') + "\nplain text, not a database file\n" + std::string(1024, 'x'));
    store->data["Notes"] = notes;

    RegistryConfig config;
    config.probe_timeout = std::chrono::milliseconds{2000};
    ConnectionRegistry registry(store, config, [](DatabaseType) -> std::unique_ptr<IDbBackend> {
        return std::make_unique<SqliteBackend>();
    });

    const auto r = registry.get("Notes");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::UNAVAILABLE);
    CHECK(r.error_message().find("not a database") != std::string::npos);
}
#endif
