#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "db/pooled_connection.hpp"
#include "mocks/mock_database.hpp"

#include <thread>

using namespace querydesk;
using namespace querydesk::testing;

TEST_CASE("Pool: construction opens no connections", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);

    CHECK(db->opened == 0);
    CHECK(pool->get_stats().total_connections == 0);

    auto conn = pool->acquire();
    REQUIRE(conn != nullptr);
    CHECK(db->opened == 1);
}

TEST_CASE("Pool: returned connection is reused", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);

    { auto conn = pool->acquire(); REQUIRE(conn != nullptr); }
    { auto conn = pool->acquire(); REQUIRE(conn != nullptr); }

    CHECK(db->opened == 1);
    const auto stats = pool->get_stats();
    CHECK(stats.total_acquires == 2);
    CHECK(stats.total_releases == 2);
    CHECK(stats.idle_connections == 1);
}

TEST_CASE("Pool: invalidated connection is discarded", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::MYSQL);

    {
        auto conn = pool->acquire();
        REQUIRE(conn != nullptr);
        conn->invalidate();
    }
    CHECK(db->closed == 1);
    CHECK(pool->get_stats().idle_connections == 0);
    CHECK(pool->get_stats().connections_invalidated == 1);

    auto next = pool->acquire();
    REQUIRE(next != nullptr);
    CHECK(db->opened == 2);
}

TEST_CASE("Pool: bounded by max_connections", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    PoolConfig config;
    config.max_connections = 1;
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL, "bounded", config);

    auto held = pool->acquire();
    REQUIRE(held != nullptr);

    auto second = pool->acquire(std::chrono::milliseconds{50});
    CHECK(second == nullptr);
    CHECK(pool->last_error().find("timed out") != std::string::npos);
    CHECK(pool->get_stats().failed_acquires == 1);

    held.reset();
    CHECK(pool->acquire(std::chrono::milliseconds{50}) != nullptr);
}

TEST_CASE("Pool: failed connect reports the driver error", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    db->accept = [](const std::string&) { return false; };
    db->reject_message = "FATAL: password authentication failed for user \"alice\"";
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);

    CHECK(pool->acquire() == nullptr);
    CHECK(pool->last_error() == db->reject_message);

    // The slot was released: a later attempt is not starved
    db->accept = {};
    CHECK(pool->acquire(std::chrono::milliseconds{50}) != nullptr);
}

TEST_CASE("Pool: session hook runs once per physical connection", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    PoolConfig config;
    config.on_connect = [](IDbConnection& c) { (void)c.execute("SET search_path TO \"reporting\""); };
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL, "hooked", config);

    { auto conn = pool->acquire(); }
    { auto conn = pool->acquire(); }

    const auto statements = db->statements();
    REQUIRE(statements.size() == 1);
    CHECK(statements[0] == "SET search_path TO \"reporting\"");
}

TEST_CASE("Pool: drain closes idle connections and refuses new acquires", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL);

    auto held = pool->acquire();
    { auto idle = pool->acquire(); }
    REQUIRE(pool->get_stats().idle_connections == 1);

    pool->drain();
    CHECK(db->closed == 1);
    CHECK(pool->acquire(std::chrono::milliseconds{10}) == nullptr);

    // Connections checked out during drain are closed on return
    held.reset();
    CHECK(db->closed == 2);
}

TEST_CASE("Pool: unhealthy idle connection is replaced", "[pool][health]") {
    auto db = std::make_shared<MockDatabase>();
    PoolConfig config;
    config.idle_timeout = std::chrono::milliseconds{1};
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL, "health", config);

    { auto conn = pool->acquire(); }
    db->healthy = false;
    std::this_thread::sleep_for(std::chrono::milliseconds{20});

    auto conn = pool->acquire();
    REQUIRE(conn != nullptr);
    CHECK(db->opened == 2);
    CHECK(pool->get_stats().health_check_failures == 1);
}

TEST_CASE("Pool: short max_lifetime causes connection recycling", "[pool][lifetime]") {
    auto db = std::make_shared<MockDatabase>();
    PoolConfig config;
    config.max_lifetime = std::chrono::seconds(1);
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL, "lifetime", config);

    { auto conn = pool->acquire(); REQUIRE(conn != nullptr); }
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    { auto conn = pool->acquire(); REQUIRE(conn != nullptr); }

    CHECK(pool->get_stats().connections_recycled >= 1);
    CHECK(db->opened == 2);
}

TEST_CASE("Pool: max_lifetime=0 disables recycling", "[pool][lifetime]") {
    auto db = std::make_shared<MockDatabase>();
    PoolConfig config;
    config.max_lifetime = std::chrono::seconds(0);
    auto pool = make_mock_pool(db, DatabaseType::POSTGRESQL, "forever", config);

    { auto conn = pool->acquire(); }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    { auto conn = pool->acquire(); }

    CHECK(pool->get_stats().connections_recycled == 0);
    CHECK(db->opened == 1);
}

TEST_CASE("Pool: connection returned after the pool is gone is closed", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    auto pool = make_mock_pool(db, DatabaseType::SQLITE);
    auto conn = pool->acquire();
    REQUIRE(conn != nullptr);

    pool.reset();
    conn.reset();
    CHECK(db->closed == 1);
}
