#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "temp_path.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace memora;

// ── Defaults ────────────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(cfg.session.max_token_limit == 3000);
    REQUIRE(cfg.session.ttl_days == 7);
    REQUIRE(cfg.session.enable_pii_redaction);
    REQUIRE(cfg.memory.importance_threshold == 0.3);
    REQUIRE(cfg.memory.max_memories_per_query == 5);
    REQUIRE(cfg.memory.consolidation_interval_hours == 24);
    REQUIRE(cfg.memory.topics.size() == 5);
    REQUIRE(cfg.pii.extended);
}

TEST_CASE("Config::from_json: defaults document matches struct defaults", "[config]") {
    Config parsed = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(parsed.store.backend == plain.store.backend);
    REQUIRE(parsed.session.max_token_limit == plain.session.max_token_limit);
    REQUIRE(parsed.memory.backends == plain.memory.backends);
    REQUIRE(parsed.memory.topics == plain.memory.topics);
    REQUIRE(parsed.worker.threads == plain.worker.threads);
}

// ── Parsing ─────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "store": {"backend": "file", "path": "/var/lib/memora"},
        "session": {"max_token_limit": 40, "ttl_days": 1, "enable_pii_redaction": false},
        "memory": {"backends": ["json"], "duplicate_threshold": 0.8, "topics": ["hobbies"]},
        "pii": {"extended": false},
        "worker": {"threads": 4, "queue_capacity": 8}
    })");
    auto cfg = Config::from_json(j);

    REQUIRE(cfg.store.backend == "file");
    REQUIRE(cfg.store_path() == "/var/lib/memora");
    REQUIRE(cfg.session.max_token_limit == 40);
    REQUIRE(cfg.session.ttl_days == 1);
    REQUIRE_FALSE(cfg.session.enable_pii_redaction);
    REQUIRE(cfg.memory.backends == std::vector<std::string>{"json"});
    REQUIRE(cfg.memory.duplicate_threshold == 0.8);
    REQUIRE(cfg.memory.topics == std::vector<std::string>{"hobbies"});
    REQUIRE_FALSE(cfg.pii.extended);
    REQUIRE(cfg.worker.threads == 4);
    REQUIRE(cfg.worker.queue_capacity == 8);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "session": {"max_token_limit": "lots", "ttl_days": -3},
        "memory": {"backends": "sqlite"}
    })");
    auto cfg = Config::from_json(j);
    REQUIRE(cfg.session.max_token_limit == 3000);
    REQUIRE(cfg.session.ttl_days == 7);
    REQUIRE(cfg.memory.backends == std::vector<std::string>{"sqlite"});
}

TEST_CASE("merge_defaults: fills missing keys without overwriting", "[config]") {
    nlohmann::json existing = {{"session", {{"ttl_days", 2}}}};
    auto merged = merge_defaults(existing, Config::defaults_json());
    REQUIRE(merged["session"]["ttl_days"] == 2);
    REQUIRE(merged["session"]["max_token_limit"] == 3000);
    REQUIRE(merged.contains("worker"));
}

// ── Loading ─────────────────────────────────────────────────────

TEST_CASE("Config::load_from: creates a default file when missing", "[config]") {
    TempPath dir("config_create");
    std::string path = dir.path + "/config.json";

    auto cfg = Config::load_from(path);
    REQUIRE(cfg.session.max_token_limit == 3000);
    REQUIRE(std::filesystem::exists(path));
}

TEST_CASE("Config::load_from: migrates partial file", "[config]") {
    TempPath dir("config_migrate");
    std::filesystem::create_directories(dir.path);
    std::string path = dir.path + "/config.json";
    {
        std::ofstream out(path);
        out << R"({"session": {"ttl_days": 3}})";
    }

    auto cfg = Config::load_from(path);
    REQUIRE(cfg.session.ttl_days == 3);

    std::ifstream in(path);
    auto written = nlohmann::json::parse(in);
    REQUIRE(written["session"]["ttl_days"] == 3);
    REQUIRE(written["memory"].contains("topics"));
}

TEST_CASE("Config::load_from: environment overrides file", "[config]") {
    TempPath dir("config_env");
    std::string path = dir.path + "/config.json";

    setenv("MEMORA_MAX_TOKENS", "123", 1);
    setenv("MEMORA_TTL_DAYS", "not-a-number", 1);
    auto cfg = Config::load_from(path);
    unsetenv("MEMORA_MAX_TOKENS");
    unsetenv("MEMORA_TTL_DAYS");

    REQUIRE(cfg.session.max_token_limit == 123);
    REQUIRE(cfg.session.ttl_days == 7);
}

TEST_CASE("Config::store_path: depends on backend", "[config]") {
    Config cfg;
    REQUIRE(cfg.store_path().size() > 9);
    REQUIRE(cfg.store_path().substr(cfg.store_path().size() - 9) == "/store.db");
    cfg.store.backend = "file";
    REQUIRE(cfg.store_path().substr(cfg.store_path().size() - 6) == "/store");
}
