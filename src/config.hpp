#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace memora {

struct StoreConfig {
    std::string backend = "sqlite";   // "sqlite" | "file"
    std::string path;                 // empty = ~/.memora/store.db or ~/.memora/store/
};

struct SessionConfig {
    uint32_t max_token_limit = 3000;
    uint32_t ttl_days = 7;
    bool enable_pii_redaction = true;
};

struct MemoryConfig {
    std::vector<std::string> backends = {"sqlite"};  // retrieval backends: "sqlite", "json"
    std::string path;                  // directory for backend files; empty = ~/.memora
    uint32_t cache_max_entries = 256;
    double duplicate_threshold = 0.9;  // token Jaccard at or above = duplicate
    double prune_importance = 0.3;     // prune below this importance ...
    uint32_t prune_age_days = 30;      // ... when older than this
    double importance_threshold = 0.3; // min importance for prompt enrichment
    uint32_t max_memories_per_query = 5;
    uint32_t consolidation_interval_hours = 24;
    std::vector<std::string> topics = {
        "personal preferences",
        "important facts",
        "user goals",
        "contact information",
        "important decisions",
    };
};

struct PiiConfig {
    bool extended = true;              // add DOB / bank account / plate rules
};

struct WorkerConfig {
    uint32_t threads = 2;
    uint32_t queue_capacity = 64;
};

struct Config {
    StoreConfig store;
    SessionConfig session;
    MemoryConfig memory;
    PiiConfig pii;
    WorkerConfig worker;

    // Load from $MEMORA_CONFIG or ~/.memora/config.json, then env vars.
    // A missing file is created with defaults; missing keys are merged in.
    static Config load();

    // Load from an explicit path (same merge + env behaviour as load()).
    static Config load_from(const std::string& path);

    // Parse an already-merged JSON document. Wrong-typed values keep defaults.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved paths with ~ expanded and defaults applied
    std::string store_path() const;
    std::string memory_dir() const;
};

// Fill keys missing from existing with values from defaults, recursively.
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace memora
