#include <catch2/catch_test_macros.hpp>
#include "memory/sqlite_memory.hpp"
#include "temp_path.hpp"

using namespace memora;

static Memory make_memory(const std::string& id, const std::string& user,
                          const std::string& content) {
    Memory m;
    m.id = id;
    m.user_id = user;
    m.content = content;
    m.importance = 0.6;
    m.created_at = 1700000000000ULL;
    m.last_accessed = m.created_at;
    m.provenance = "test";
    return m;
}

struct SqliteFixture {
    TempPath file{"sqlite_memory"};
    SqliteMemory mem{file.path};
};

// ── Query helpers ───────────────────────────────────────────────

TEST_CASE("build_fts_query: quotes and OR-joins tokens", "[sqlite_memory]") {
    REQUIRE(build_fts_query("coffee milk") == "\"coffee\" OR \"milk\"");
    REQUIRE(build_fts_query("a cup of tea?") == "\"cup\" OR \"of\" OR \"tea\"");
    REQUIRE(build_fts_query("\"DROP\" TABLE; --") == "\"DROP\" OR \"TABLE\"");
}

TEST_CASE("build_fts_query: nothing usable gives empty", "[sqlite_memory]") {
    REQUIRE(build_fts_query("").empty());
    REQUIRE(build_fts_query("a ? ! -").empty());
}

TEST_CASE("bm25_relevance: maps rank onto [0, 1)", "[sqlite_memory]") {
    REQUIRE(bm25_relevance(0.0) == 0.0);
    REQUIRE(bm25_relevance(3.0) == 0.0);
    REQUIRE(bm25_relevance(-1.0) == 0.5);
    REQUIRE(bm25_relevance(-9.0) > bm25_relevance(-1.0));
    REQUIRE(bm25_relevance(-1e9) < 1.0);
}

// ── Store / search ──────────────────────────────────────────────

TEST_CASE("SqliteMemory: store and search", "[sqlite_memory]") {
    SqliteFixture f;
    REQUIRE(f.mem.store(make_memory("m1", "u1", "User prefers coffee with oat milk")));
    REQUIRE(f.mem.store(make_memory("m2", "u1", "User drinks coffee every morning")));
    REQUIRE(f.mem.store(make_memory("m3", "u1", "User dislikes tea")));
    REQUIRE(f.mem.store(make_memory("m4", "u1", "Favourite juice is orange")));
    REQUIRE(f.mem.count() == 4);

    auto hits = f.mem.search("u1", "coffee milk", 10);
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].memory.id == "m1");
    REQUIRE(hits[0].memory.content == "User prefers coffee with oat milk");
    REQUIRE(hits[0].memory.provenance == "test");
    for (const auto& hit : hits) {
        REQUIRE(hit.relevance >= 0.0);
        REQUIRE(hit.relevance < 1.0);
    }
    REQUIRE(hits[0].relevance >= hits[1].relevance);
}

TEST_CASE("SqliteMemory: search is scoped to the user", "[sqlite_memory]") {
    SqliteFixture f;
    f.mem.store(make_memory("m1", "u1", "likes hiking in the mountains"));
    f.mem.store(make_memory("m2", "u2", "likes hiking by the sea"));

    auto hits = f.mem.search("u2", "hiking", 10);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].memory.id == "m2");
    REQUIRE(f.mem.search("u3", "hiking", 10).empty());
}

TEST_CASE("SqliteMemory: top_k limits results", "[sqlite_memory]") {
    SqliteFixture f;
    for (int i = 0; i < 6; i++) {
        f.mem.store(make_memory("m" + std::to_string(i), "u1",
                                "note number " + std::to_string(i) + " about gardening"));
    }
    REQUIRE(f.mem.search("u1", "gardening", 3).size() == 3);
    REQUIRE(f.mem.search("u1", "gardening", 0).empty());
    REQUIRE(f.mem.search("u1", "!!", 3).empty());
}

TEST_CASE("SqliteMemory: upsert replaces content", "[sqlite_memory]") {
    SqliteFixture f;
    f.mem.store(make_memory("m1", "u1", "favourite colour is blue"));
    f.mem.store(make_memory("m1", "u1", "favourite colour is green"));

    REQUIRE(f.mem.count() == 1);
    REQUIRE(f.mem.search("u1", "blue", 5).empty());
    auto hits = f.mem.search("u1", "green", 5);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].memory.content == "favourite colour is green");
}

TEST_CASE("SqliteMemory: remove is idempotent", "[sqlite_memory]") {
    SqliteFixture f;
    f.mem.store(make_memory("m1", "u1", "owns a bicycle"));

    REQUIRE(f.mem.remove("m1"));
    REQUIRE(f.mem.count() == 0);
    REQUIRE(f.mem.search("u1", "bicycle", 5).empty());
    REQUIRE(f.mem.remove("m1"));
    REQUIRE(f.mem.remove("never-existed"));
}

TEST_CASE("SqliteMemory: index survives reopen", "[sqlite_memory]") {
    TempPath file("sqlite_reopen");
    const std::string& path = file.path;
    {
        SqliteMemory mem(path);
        mem.store(make_memory("m1", "u1", "speaks Finnish and Swedish"));
    }
    {
        SqliteMemory mem(path);
        auto hits = mem.search("u1", "swedish", 5);
        REQUIRE(hits.size() == 1);
        REQUIRE(hits[0].memory.id == "m1");
    }
}
