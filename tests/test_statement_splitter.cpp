#include <catch2/catch_test_macros.hpp>
#include "parser/statement_splitter.hpp"

using namespace querydesk;

TEST_CASE("StatementSplitter: split", "[splitter]") {
    SECTION("trims and drops empty segments") {
        const auto stmts = StatementSplitter::split("  SELECT 1 ;; \n SELECT 2;\n  ;  ");
        REQUIRE(stmts.size() == 2);
        CHECK(stmts[0] == "SELECT 1");
        CHECK(stmts[1] == "SELECT 2");
    }

    SECTION("keeps textual order") {
        const auto stmts = StatementSplitter::split(
            "CREATE TABLE t(id INTEGER PRIMARY KEY, name TEXT); "
            "INSERT INTO t(name) VALUES ('alice'),('bob'); "
            "SELECT id, name FROM t ORDER BY id;");
        REQUIRE(stmts.size() == 3);
        CHECK(stmts[0].starts_with("CREATE TABLE"));
        CHECK(stmts[1].starts_with("INSERT INTO"));
        CHECK(stmts[2].starts_with("SELECT id"));
    }

    SECTION("empty and whitespace-only input") {
        CHECK(StatementSplitter::split("").empty());
        CHECK(StatementSplitter::split(" \n\t ; ;").empty());
    }

    SECTION("no trailing semicolon") {
        const auto stmts = StatementSplitter::split("SELECT 1");
        REQUIRE(stmts.size() == 1);
        CHECK(stmts[0] == "SELECT 1");
    }

    SECTION("semicolons inside literals are not protected") {
        const auto stmts = StatementSplitter::split("SELECT 'a;b'");
        CHECK(stmts.size() == 2);
    }
}

TEST_CASE("StatementSplitter: connection directives", "[splitter]") {
    SECTION("comment form") {
        const auto r = StatementSplitter::extract_connection_directive(
            "-- connection: prod_db\nSELECT * FROM orders;");
        REQUIRE(r.connection_name.has_value());
        CHECK(*r.connection_name == "prod_db");
        CHECK(r.remaining_sql == "SELECT * FROM orders;");
    }

    SECTION("pseudo-statement form, case-insensitive") {
        const auto r = StatementSplitter::extract_connection_directive(
            "use connection Analytics;\nSELECT 1");
        REQUIRE(r.connection_name.has_value());
        CHECK(*r.connection_name == "Analytics");
        CHECK(r.remaining_sql == "SELECT 1");
    }

    SECTION("leading blank lines are allowed") {
        const auto r = StatementSplitter::extract_connection_directive(
            "\n\n  --Connection:dev\nSELECT 2");
        REQUIRE(r.connection_name.has_value());
        CHECK(*r.connection_name == "dev");
        CHECK(r.remaining_sql == "SELECT 2");
    }

    SECTION("only one directive is stripped") {
        const auto r = StatementSplitter::extract_connection_directive(
            "-- connection: a\n-- connection: b\nSELECT 3");
        REQUIRE(r.connection_name.has_value());
        CHECK(*r.connection_name == "a");
        CHECK(r.remaining_sql == "-- connection: b\nSELECT 3");
    }

    SECTION("no directive leaves text untouched") {
        const std::string sql = "SELECT 1;\n-- connection: late";
        const auto r = StatementSplitter::extract_connection_directive(sql);
        CHECK_FALSE(r.connection_name.has_value());
        CHECK(r.remaining_sql == sql);
    }
}

TEST_CASE("StatementSplitter: primary table extraction", "[splitter]") {
    SECTION("plain and qualified names") {
        CHECK(StatementSplitter::extract_primary_table("SELECT * FROM users") == "users");
        CHECK(StatementSplitter::extract_primary_table("select a from public.users u where a=1")
              == "public.users");
    }

    SECTION("quoting is stripped") {
        CHECK(StatementSplitter::extract_primary_table(R"(SELECT * FROM "Sales"."Order Items")")
              == "Sales.Order Items");
        CHECK(StatementSplitter::extract_primary_table("SELECT * FROM `shop`.`items`") == "shop.items");
        CHECK(StatementSplitter::extract_primary_table("SELECT * FROM [dbo].[t1]") == "dbo.t1");
    }

    SECTION("FROM inside function calls and literals is ignored") {
        CHECK(StatementSplitter::extract_primary_table(
                  "SELECT EXTRACT(YEAR FROM created) , 'from x' FROM events") == "events");
    }

    SECTION("comments are skipped") {
        CHECK(StatementSplitter::extract_primary_table(
                  "-- FROM nothing\nSELECT 1 /* FROM bad */ FROM good") == "good");
    }

    SECTION("ambiguous input yields none") {
        CHECK_FALSE(StatementSplitter::extract_primary_table("SELECT 1").has_value());
        CHECK_FALSE(StatementSplitter::extract_primary_table("SELECT * FROM (SELECT 1) s").has_value());
        CHECK_FALSE(StatementSplitter::extract_primary_table("SELECT * FROM").has_value());
    }
}

TEST_CASE("StatementSplitter: qualified name splitting", "[splitter]") {
    CHECK(StatementSplitter::split_qualified_name("public.users")
          == std::vector<std::string>{"public", "users"});
    CHECK(StatementSplitter::split_qualified_name(R"("my.schema"."T")")
          == std::vector<std::string>{"my.schema", "T"});
    CHECK(StatementSplitter::split_qualified_name("orders")
          == std::vector<std::string>{"orders"});
}
