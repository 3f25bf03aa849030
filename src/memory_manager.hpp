#pragma once
#include "config.hpp"
#include "memory.hpp"
#include "similarity.hpp"
#include "status.hpp"
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <cstdint>

namespace memora {

class EventBus;      // forward declaration
class Extractor;     // forward declaration
class KeyValueStore; // forward declaration

struct RecallQuery {
    std::string user_id;
    std::string query;
    uint32_t top_k = 5;
    std::vector<MemoryType> memory_types;   // empty = any type
    double min_importance = 0.0;
    std::optional<uint32_t> max_age_days;   // whole days since created_at
};

// Long-term memory: owns every Memory record.
//
// Records live in the key-value store under memory/<id> and are the
// source of truth; retrieval backends are search indexes fed on store().
// Writes for one user (store, remove, consolidate) are serialized by a
// per-user mutex. Capabilities passed in must outlive the manager.
class MemoryManager {
public:
    MemoryManager(KeyValueStore& store, Extractor& extractor,
                  const SimilarityCheck& similarity, MemoryConfig config);

    void add_backend(MemoryBackend* backend);
    void set_conflict_detector(const ConflictDetector* detector) { conflicts_ = detector; }
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    // Extract, classify, score and store a memory from conversation text.
    // nullopt when nothing relevant was found or the memory could not be stored.
    // An empty topic list means the configured topics.
    std::optional<Memory> generate_memory(const std::string& user_id,
                                          const std::string& conversation_text,
                                          const std::vector<std::string>& topics);

    // Write the record and index it in every backend.
    Status store(const Memory& memory);

    // Blended-score ranking over backend candidates, see RecallQuery.
    std::vector<Memory> retrieve(const RecallQuery& query);

    // Both memory types at or above the configured importance threshold.
    // top_k 0 means memory.max_memories_per_query.
    std::vector<Memory> retrieve_context(const std::string& user_id,
                                         const std::string& query,
                                         uint32_t top_k = 0);

    // Prompt block listing memories; empty string for none.
    static std::string format_context(const std::vector<Memory>& memories);

    // Merge duplicates, flag conflicts, prune stale low-importance memories.
    Status consolidate(const std::string& user_id);
    Status consolidate(const std::string& user_id, ConsolidationReport& report);

    // Idempotent: removing an unknown id succeeds.
    Status remove(const std::string& memory_id);

    // All of a user's memories, oldest first.
    std::vector<Memory> list_memories(const std::string& user_id);
    std::optional<Memory> get(const std::string& memory_id);

    // Users that own at least one memory
    std::vector<std::string> list_users();

    size_t cache_size() const;
    const MemoryConfig& config() const { return config_; }

private:
    struct CacheEntry {
        uint64_t generation = 0;
        std::vector<Memory> results;
    };

    std::shared_ptr<std::mutex> lock_for(const std::string& user_id);

    std::optional<Memory> load(const std::string& memory_id);
    std::vector<Memory> load_all();
    Status store_locked(const Memory& memory);
    Status remove_locked(const std::string& memory_id);

    std::vector<ScoredMemory> gather_candidates(const RecallQuery& query);

    uint64_t generation_of(const std::string& user_id);
    void bump_generation(const std::string& user_id);
    std::optional<std::vector<Memory>> cache_lookup(const std::string& key,
                                                    const std::string& user_id);
    void cache_insert(const std::string& key, uint64_t generation,
                      std::vector<Memory> results);

    void publish_stored(const Memory& memory);
    void publish_removed(const std::string& memory_id, const std::string& user_id);

    KeyValueStore& store_;
    Extractor& extractor_;
    const SimilarityCheck& similarity_;
    MemoryConfig config_;
    std::vector<MemoryBackend*> backends_;
    const ConflictDetector* conflicts_ = nullptr;
    EventBus* event_bus_ = nullptr;

    std::unordered_map<std::string, std::shared_ptr<std::mutex>> user_locks_;
    std::mutex locks_mutex_;

    std::unordered_map<std::string, CacheEntry> query_cache_;
    std::deque<std::string> cache_order_;   // insertion order for eviction
    std::unordered_map<std::string, uint64_t> generations_;
    mutable std::mutex cache_mutex_;
};

// Memory id: mem_<epoch ms>_<random hex>_<user id restricted to [A-Za-z0-9_-]>
std::string make_memory_id(const std::string& user_id, uint64_t epoch_ms);

} // namespace memora
