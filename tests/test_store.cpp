#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "store.hpp"
#include "store/file_store.hpp"
#include "store/sqlite_store.hpp"
#include "temp_path.hpp"
#include <fstream>

using namespace memora;

// Behaviour every KeyValueStore must share
static void check_basic_contract(KeyValueStore& store) {
    REQUIRE_FALSE(store.get("session/missing").has_value());

    REQUIRE(store.set("session/a", R"({"n":1})"));
    REQUIRE(store.get("session/a").value_or("") == R"({"n":1})");

    REQUIRE(store.set("session/a", R"({"n":2})"));
    REQUIRE(store.get("session/a").value_or("") == R"({"n":2})");

    REQUIRE(store.set("session/b", "{}"));
    REQUIRE(store.set("memory/m1", "{}"));

    auto sessions = store.list_keys("session/");
    REQUIRE(sessions == std::vector<std::string>{"session/a", "session/b"});
    REQUIRE(store.list_keys("").size() == 3);

    REQUIRE(store.remove("session/a"));
    REQUIRE_FALSE(store.get("session/a").has_value());
    REQUIRE(store.remove("session/a"));
    REQUIRE(store.list_keys("session/") == std::vector<std::string>{"session/b"});
}

// ── FileStore ───────────────────────────────────────────────────

TEST_CASE("FileStore: get, set, remove, list", "[store]") {
    TempPath dir("file_store");
    FileStore store(dir.path);
    REQUIRE(store.backend_name() == "file");
    check_basic_contract(store);
}

TEST_CASE("FileStore: one JSON document per key", "[store]") {
    TempPath dir("file_store_layout");
    FileStore store(dir.path);
    REQUIRE(store.set("memory/mem_1", "{}"));
    REQUIRE(std::filesystem::exists(dir.path + "/memory/mem_1.json"));
}

TEST_CASE("FileStore: rejects keys escaping the root", "[store]") {
    TempPath dir("file_store_keys");
    FileStore store(dir.path);
    REQUIRE_FALSE(store.set("../outside", "{}"));
    REQUIRE_FALSE(store.set("/abs", "{}"));
    REQUIRE_FALSE(store.set("a//b", "{}"));
    REQUIRE_FALSE(store.set("", "{}"));
    REQUIRE_FALSE(store.get("../outside").has_value());
}

TEST_CASE("FileStore: list skips temp leftovers", "[store]") {
    TempPath dir("file_store_tmp");
    FileStore store(dir.path);
    REQUIRE(store.set("session/a", "{}"));
    std::ofstream(dir.path + "/session/b.json.tmp") << "{}";
    REQUIRE(store.list_keys("session/") == std::vector<std::string>{"session/a"});
}

TEST_CASE("FileStore: data survives reopening", "[store]") {
    TempPath dir("file_store_reopen");
    {
        FileStore store(dir.path);
        REQUIRE(store.set("session/x", "payload"));
    }
    FileStore reopened(dir.path);
    REQUIRE(reopened.get("session/x").value_or("") == "payload");
}

// ── SqliteStore ─────────────────────────────────────────────────

TEST_CASE("SqliteStore: get, set, remove, list", "[store]") {
    TempPath db("sqlite_store");
    SqliteStore store(db.path);
    REQUIRE(store.backend_name() == "sqlite");
    check_basic_contract(store);
}

TEST_CASE("SqliteStore: prefix is literal, not a pattern", "[store]") {
    TempPath db("sqlite_store_prefix");
    SqliteStore store(db.path);
    REQUIRE(store.set("a_b/1", "{}"));
    REQUIRE(store.set("axb/1", "{}"));
    REQUIRE(store.list_keys("a_b/") == std::vector<std::string>{"a_b/1"});
}

TEST_CASE("SqliteStore: data survives reopening", "[store]") {
    TempPath db("sqlite_store_reopen");
    {
        SqliteStore store(db.path);
        REQUIRE(store.set("memory/m", "payload"));
    }
    SqliteStore reopened(db.path);
    REQUIRE(reopened.get("memory/m").value_or("") == "payload");
}

// ── Factory ─────────────────────────────────────────────────────

TEST_CASE("create_store: picks the configured backend", "[store]") {
    TempPath dir("store_factory");
    Config cfg;

    cfg.store.backend = "file";
    cfg.store.path = dir.path + "/files";
    REQUIRE(create_store(cfg)->backend_name() == "file");

    cfg.store.backend = "sqlite";
    cfg.store.path = dir.path + "/store.db";
    REQUIRE(create_store(cfg)->backend_name() == "sqlite");

    cfg.store.backend = "carrier-pigeon";
    cfg.store.path = dir.path + "/fallback";
    REQUIRE(create_store(cfg)->backend_name() == "file");
}
