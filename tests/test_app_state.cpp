#include <catch2/catch_test_macros.hpp>
#include "state/app_state_store.hpp"
#include "mocks/temp_dir.hpp"

using namespace querydesk;
using namespace querydesk::testing;

TEST_CASE("AppState: save and reload", "[state]") {
    TempDir dir;
    const AppStateStore store(dir.file("sub/app_state.json"));

    const AppState state{"SELECT *\nFROM \"orders\" -- é", true};
    REQUIRE(store.save(state));
    CHECK(store.load() == state);
}

TEST_CASE("AppState: unreadable input falls back to defaults", "[state]") {
    TempDir dir;

    SECTION("missing file") {
        CHECK(AppStateStore(dir.file("none.json")).load() == AppState{});
    }

    SECTION("malformed json") {
        CHECK(AppStateStore(dir.write("s.json", "{\"last_sql\": ")).load() == AppState{});
    }

    SECTION("wrong field types fall back one by one") {
        const auto state = AppStateStore(dir.write("s.json", R"({"last_sql": 12, "dark_mode": true})")).load();
        CHECK(state.last_sql.empty());
        CHECK(state.dark_mode);
    }
}

TEST_CASE("AppState: failed save is reported", "[state]") {
    TempDir dir;
    const auto blocker = dir.write("blocker", "not a directory");
    CHECK_FALSE(AppStateStore(blocker + "/app_state.json").save(AppState{"SELECT 1", false}));
}

TEST_CASE("AppState: text that is not UTF-8 is not written", "[state]") {
    TempDir dir;
    const auto path = dir.file("app_state.json");
    const AppStateStore store(path);

    bool saved = true;
    REQUIRE_NOTHROW(saved = store.save(AppState{"SELECT '\xFF'", true}));
    CHECK_FALSE(saved);
    CHECK(store.load() == AppState{});
}
