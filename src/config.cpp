#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace memora {

nlohmann::json Config::defaults_json() {
    MemoryConfig mem;
    return {
        {"store", {
            {"backend", "sqlite"},
            {"path", ""}
        }},
        {"session", {
            {"max_token_limit", 3000},
            {"ttl_days", 7},
            {"enable_pii_redaction", true}
        }},
        {"memory", {
            {"backends", nlohmann::json::array({"sqlite"})},
            {"path", ""},
            {"cache_max_entries", 256},
            {"duplicate_threshold", 0.9},
            {"prune_importance", 0.3},
            {"prune_age_days", 30},
            {"importance_threshold", 0.3},
            {"max_memories_per_query", 5},
            {"consolidation_interval_hours", 24},
            {"topics", mem.topics}
        }},
        {"pii", {
            {"extended", true}
        }},
        {"worker", {
            {"threads", 2},
            {"queue_capacity", 64}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static std::vector<std::string> string_array(const nlohmann::json& arr) {
    std::vector<std::string> out;
    for (const auto& v : arr) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

// Typed readers: leave `out` untouched when the key is absent or mistyped.
static void read(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

static void read(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean()) out = obj[key].get<bool>();
}

static void read(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<double>();
}

// Integers parsed from a file are unsigned, literals built in code are signed.
static void read(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return;
    auto v = obj[key].get<int64_t>();
    if (v >= 0 && v <= static_cast<int64_t>(UINT32_MAX)) out = static_cast<uint32_t>(v);
}

static void read(const nlohmann::json& obj, const char* key, std::vector<std::string>& out) {
    if (obj.contains(key) && obj[key].is_array()) out = string_array(obj[key]);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        read(s, "backend", cfg.store.backend);
        read(s, "path", cfg.store.path);
    }

    if (j.contains("session") && j["session"].is_object()) {
        auto& s = j["session"];
        read(s, "max_token_limit", cfg.session.max_token_limit);
        read(s, "ttl_days", cfg.session.ttl_days);
        read(s, "enable_pii_redaction", cfg.session.enable_pii_redaction);
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        read(m, "backends", cfg.memory.backends);
        read(m, "path", cfg.memory.path);
        read(m, "cache_max_entries", cfg.memory.cache_max_entries);
        read(m, "duplicate_threshold", cfg.memory.duplicate_threshold);
        read(m, "prune_importance", cfg.memory.prune_importance);
        read(m, "prune_age_days", cfg.memory.prune_age_days);
        read(m, "importance_threshold", cfg.memory.importance_threshold);
        read(m, "max_memories_per_query", cfg.memory.max_memories_per_query);
        read(m, "consolidation_interval_hours", cfg.memory.consolidation_interval_hours);
        read(m, "topics", cfg.memory.topics);
    }

    if (j.contains("pii") && j["pii"].is_object()) {
        read(j["pii"], "extended", cfg.pii.extended);
    }

    if (j.contains("worker") && j["worker"].is_object()) {
        auto& w = j["worker"];
        read(w, "threads", cfg.worker.threads);
        read(w, "queue_capacity", cfg.worker.queue_capacity);
    }

    return cfg;
}

static void apply_env(Config& cfg) {
    if (const char* v = std::getenv("MEMORA_STORE_PATH"))
        cfg.store.path = v;
    if (const char* v = std::getenv("MEMORA_MAX_TOKENS")) {
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0' && n > 0) cfg.session.max_token_limit = static_cast<uint32_t>(n);
    }
    if (const char* v = std::getenv("MEMORA_TTL_DAYS")) {
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0') cfg.session.ttl_days = static_cast<uint32_t>(n);
    }
}

Config Config::load() {
    const char* override_path = std::getenv("MEMORA_CONFIG");
    return load_from(override_path ? override_path : expand_home("~/.memora/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    apply_env(cfg);
    return cfg;
}

std::string Config::store_path() const {
    if (!store.path.empty()) return expand_home(store.path);
    if (store.backend == "file") return expand_home("~/.memora/store");
    return expand_home("~/.memora/store.db");
}

std::string Config::memory_dir() const {
    if (!memory.path.empty()) return expand_home(memory.path);
    return expand_home("~/.memora");
}

} // namespace memora
