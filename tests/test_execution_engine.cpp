#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "executor/execution_engine.hpp"
#include "mocks/mock_database.hpp"
#include "mocks/temp_dir.hpp"

#ifdef ENABLE_SQLITE
#include "db/sqlite/sqlite_connection.hpp"
#endif

#include <thread>

using namespace querydesk;
using namespace querydesk::testing;
using namespace std::chrono_literals;

namespace {

std::vector<Row> numbered_rows(size_t count) {
    std::vector<Row> rows;
    for (size_t i = 0; i < count; ++i) {
        rows.push_back(Row{std::to_string(i + 1)});
    }
    return rows;
}

ExecutionEngine fast_engine(std::chrono::milliseconds statement_timeout = 5000ms) {
    ExecutionEngine::Config config;
    config.statement_timeout = statement_timeout;
    config.poll_interval = 10ms;
    config.acquire_timeout = 500ms;
    return ExecutionEngine(config);
}

} // namespace

TEST_CASE("ExecutionEngine: empty input yields no results", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);
    CancelToken cancel;

    const auto result = fast_engine().run(pool, "  ;  ; \n", 100, cancel);
    REQUIRE(result.is_ok());
    CHECK(result.value().empty());
    CHECK(db->opened == 0);
}

TEST_CASE("ExecutionEngine: row limit keeps min(N, M) rows", "[engine]") {
    const size_t limit = GENERATE(size_t{1}, size_t{5}, size_t{10});
    const size_t available = GENERATE(size_t{0}, size_t{4}, size_t{5}, size_t{6}, size_t{50});

    auto db = std::make_shared<MockDatabase>();
    db->handler = [available](const std::string&, const std::vector<Cell>&) {
        return ok_rows({"n"}, numbered_rows(available));
    };
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);
    CancelToken cancel;

    const auto result = fast_engine().run(pool, "SELECT n FROM numbers", limit, cancel);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 1);
    const auto& r = result.value().front();
    CHECK(r.rows.size() == std::min(limit, available));
    CHECK(r.truncated == (available > limit));
    CHECK(r.columns == std::vector<std::string>{"n"});
}

TEST_CASE("ExecutionEngine: zero row limit is unlimited", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    db->handler = [](const std::string&, const std::vector<Cell>&) {
        return ok_rows({"n"}, numbered_rows(2500));
    };
    auto pool = make_mock_pool(db, DatabaseType::MYSQL);
    CancelToken cancel;

    const auto result = fast_engine().run(pool, "SELECT n FROM numbers", 0, cancel);
    REQUIRE(result.is_ok());
    CHECK(result.value().front().rows.size() == 2500);
    CHECK_FALSE(result.value().front().truncated);
}

TEST_CASE("ExecutionEngine: mutations report affected rows", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    db->handler = [](const std::string&, const std::vector<Cell>&) { return ok_affected(3); };
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);
    CancelToken cancel;

    const auto result = fast_engine().run(pool, "UPDATE t SET a = 1", 10, cancel);
    REQUIRE(result.is_ok());
    const auto& r = result.value().front();
    CHECK(r.columns == std::vector<std::string>{"Message"});
    REQUIRE(r.rows.size() == 1);
    CHECK(r.rows[0][0] == "Affected rows: 3");
    CHECK_FALSE(r.truncated);
    CHECK(r.statement == "UPDATE t SET a = 1");
}

TEST_CASE("ExecutionEngine: statements share one connection in order", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);
    CancelToken cancel;

    std::vector<std::string> seen;
    const auto result = fast_engine().run(pool, "SET search_path TO mart; CREATE TEMP TABLE x(a int); SELECT 1", 10,
        cancel, [&seen](const ExecutionResult& r) { seen.push_back(r.statement); });

    REQUIRE(result.is_ok());
    CHECK(result.value().size() == 3);
    CHECK(db->opened == 1);
    CHECK(db->statements() == std::vector<std::string>{
        "SET search_path TO mart", "CREATE TEMP TABLE x(a int)", "SELECT 1"});
    CHECK(seen == db->statements());
}

TEST_CASE("ExecutionEngine: first failure aborts the call", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    db->handler = [](const std::string& sql, const std::vector<Cell>&) {
        if (sql.starts_with("INSERT")) return failed("duplicate key value violates unique constraint");
        return ok_affected(1);
    };
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);
    CancelToken cancel;

    int callbacks = 0;
    const auto result = fast_engine().run(pool, "DELETE FROM a; INSERT INTO a VALUES (1); DELETE FROM b", 10,
        cancel, [&callbacks](const ExecutionResult&) { ++callbacks; });

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STATEMENT_ERROR);
    CHECK(result.context() == "INSERT INTO a VALUES (1)");
    CHECK(result.error_message().find("duplicate key") != std::string::npos);
    CHECK(callbacks == 1);
    CHECK(db->statements().size() == 2);
}

TEST_CASE("ExecutionEngine: cancellation before a statement stops the sequence", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);
    CancelToken cancel;

    const auto result = fast_engine().run(pool, "SELECT 1; SELECT 2; SELECT 3", 10, cancel,
        [&cancel](const ExecutionResult&) { cancel.cancel(); });
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CANCELED);
    CHECK(result.context() == "SELECT 2");
    CHECK(db->statements() == std::vector<std::string>{"SELECT 1"});
}

TEST_CASE("ExecutionEngine: already canceled token executes nothing", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::SQLITE);
    CancelToken cancel;
    cancel.cancel();

    const auto result = fast_engine().run(pool, "SELECT 1; SELECT 2", 10, cancel);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CANCELED);
    CHECK(db->statements().empty());
}

TEST_CASE("ExecutionEngine: in-flight cancellation interrupts the driver", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    db->block_marker = "pg_sleep";
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);
    CancelToken cancel;

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(100ms);
        cancel.cancel();
    });
    const auto result = fast_engine().run(pool, "SELECT pg_sleep(60); SELECT 2", 10, cancel);
    canceller.join();

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CANCELED);
    CHECK(result.context() == "SELECT pg_sleep(60)");
    CHECK(db->interrupts >= 1);

    // The torn-down connection is never handed out again
    std::this_thread::sleep_for(50ms);
    auto next = pool->acquire(500ms);
    REQUIRE(next != nullptr);
    CHECK(db->opened == 2);
}

TEST_CASE("ExecutionEngine: statement timeout", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    db->block_marker = "pg_sleep";
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);
    CancelToken cancel;

    const auto result = fast_engine(200ms).run(pool, "SELECT pg_sleep(60)", 10, cancel);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::TIMEOUT);
    CHECK(result.context() == "SELECT pg_sleep(60)");
    CHECK(result.error_message().find("timed out") != std::string::npos);
    CHECK(db->interrupts >= 1);
}

TEST_CASE("ExecutionEngine: server-side timeout is applied", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);
    CancelToken cancel;

    const auto result = fast_engine(1500ms).run(pool, "SELECT 1", 10, cancel);
    REQUIRE(result.is_ok());

    auto conn = pool->acquire(500ms);
    REQUIRE(conn != nullptr);
    auto* mock = dynamic_cast<MockConnection*>(conn->get());
    REQUIRE(mock != nullptr);
    CHECK(mock->timeout_ms() == 1500);
}

TEST_CASE("ExecutionEngine: unreachable connection is unavailable", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    db->accept = [](const std::string&) { return false; };
    db->reject_message = "could not connect to server";
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL, "Down");
    CancelToken cancel;

    const auto result = fast_engine().run(pool, "SELECT 1", 10, cancel);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::UNAVAILABLE);
    CHECK(result.error_message().find("Down") != std::string::npos);
    CHECK(result.error_message().find("could not connect") != std::string::npos);
}

TEST_CASE("ExecutionEngine: leading directive selects the connection", "[engine]") {
    auto main_db = std::make_shared<MockDatabase>();
    auto report_db = std::make_shared<MockDatabase>();
    FixedConnectionSource source;
    source.pools["main"] = make_mock_pool(main_db, DatabaseType::POSTGRESQL, "main");
    source.pools["reports"] = make_mock_pool(report_db, DatabaseType::MYSQL, "reports");
    CancelToken cancel;
    const auto engine = fast_engine();

    SECTION("comment form") {
        const auto result = engine.run(source, "main", "-- connection: reports\nSELECT 1", 10, cancel);
        REQUIRE(result.is_ok());
        CHECK(report_db->statements() == std::vector<std::string>{"SELECT 1"});
        CHECK(main_db->statements().empty());
    }

    SECTION("no directive uses the default") {
        const auto result = engine.run(source, "main", "SELECT 2", 10, cancel);
        REQUIRE(result.is_ok());
        CHECK(main_db->statements() == std::vector<std::string>{"SELECT 2"});
    }

    SECTION("unknown name") {
        const auto result = engine.run(source, "main", "USE CONNECTION nowhere;\nSELECT 1", 10, cancel);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::NOT_FOUND);
    }

    SECTION("nothing selected") {
        const auto result = engine.run(source, "", "SELECT 1", 10, cancel);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    }
}

TEST_CASE("ExecutionEngine: run_async delivers results on another thread", "[engine]") {
    auto db = std::make_shared<MockDatabase>();
    db->handler = [](const std::string&, const std::vector<Cell>&) {
        return ok_rows({"v"}, {Row{"42"}});
    };
    auto pool = make_mock_pool(db, DatabaseType::SQLITE);

    const auto caller = std::this_thread::get_id();
    std::atomic<bool> other_thread{false};
    auto future = fast_engine().run_async(pool, "SELECT 42", 10, nullptr,
        [&](const ExecutionResult&) { other_thread = std::this_thread::get_id() != caller; });

    const auto result = future.get();
    REQUIRE(result.is_ok());
    CHECK(result.value().front().rows[0][0] == "42");
    CHECK(other_thread);
}

#ifdef ENABLE_SQLITE
TEST_CASE("ExecutionEngine: SQLite statements observe earlier effects", "[engine][sqlite]") {
    TempDir dir;
    PoolConfig config;
    config.connection_string = dir.write("ordering.db", "");
    auto pool = std::make_shared<GenericConnectionPool>("ordering", DatabaseType::SQLITE, config,
        std::make_shared<SqliteConnectionFactory>());
    CancelToken cancel;

    const auto result = fast_engine().run(pool,
        "CREATE TABLE t(id INTEGER PRIMARY KEY, name TEXT); "
        "INSERT INTO t(name) VALUES ('alice'),('bob'); "
        "SELECT id, name FROM t ORDER BY id;", 1000, cancel);

    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 3);
    CHECK(result.value()[1].rows[0][0] == "Affected rows: 2");

    const auto& select = result.value()[2];
    CHECK(select.columns == std::vector<std::string>{"id", "name"});
    REQUIRE(select.rows.size() == 2);
    CHECK(select.rows[0] == Row{"1", "alice"});
    CHECK(select.rows[1] == Row{"2", "bob"});
    CHECK_FALSE(select.truncated);

    SECTION("row limit on a real driver") {
        const auto limited = fast_engine().run(pool, "SELECT name FROM t ORDER BY id", 1, cancel);
        REQUIRE(limited.is_ok());
        CHECK(limited.value().front().rows.size() == 1);
        CHECK(limited.value().front().truncated);
    }

    SECTION("DDL after DML does not repeat the previous count") {
        const auto mixed = fast_engine().run(pool,
            "INSERT INTO t(name) VALUES ('carol'),('dave'); CREATE TABLE u(x)", 10, cancel);
        REQUIRE(mixed.is_ok());
        REQUIRE(mixed.value().size() == 2);
        CHECK(mixed.value()[0].rows[0][0] == "Affected rows: 2");
        CHECK(mixed.value()[1].rows[0][0] == "Affected rows: 0");
    }

    SECTION("driver errors carry the statement") {
        const auto bad = fast_engine().run(pool, "SELECT nope FROM t", 10, cancel);
        REQUIRE(bad.is_error());
        CHECK(bad.error_category() == ErrorCategory::STATEMENT_ERROR);
        CHECK(bad.context() == "SELECT nope FROM t");
    }
}
#endif
