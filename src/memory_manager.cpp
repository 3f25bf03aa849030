#include "memory_manager.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "extractor.hpp"
#include "memory_json.hpp"
#include "store.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace memora {

static constexpr uint64_t kMillisPerDay = 86400ULL * 1000ULL;
static const std::string kMemoryPrefix = "memory/";
static const char* const kProvenance = "conversation_etl";

std::string make_memory_id(const std::string& user_id, uint64_t epoch_ms) {
    std::string owner;
    owner.reserve(user_id.size());
    for (char c : user_id) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') owner += c;
    }
    return "mem_" + std::to_string(epoch_ms) + "_" + generate_id() + "_" + owner;
}

static std::string cache_key(const RecallQuery& q) {
    std::ostringstream ss;
    ss << q.user_id << '\x1f' << q.query << '\x1f' << q.top_k << '\x1f';
    for (auto type : q.memory_types) ss << memory_type_to_string(type) << ',';
    ss << '\x1f' << std::setprecision(17) << q.min_importance << '\x1f';
    if (q.max_age_days) ss << *q.max_age_days; else ss << '-';
    return ss.str();
}

static uint64_t age_of(const Memory& memory, uint64_t now) {
    return now > memory.created_at ? now - memory.created_at : 0;
}

MemoryManager::MemoryManager(KeyValueStore& store, Extractor& extractor,
                             const SimilarityCheck& similarity, MemoryConfig config)
    : store_(store), extractor_(extractor), similarity_(similarity),
      config_(std::move(config))
{}

void MemoryManager::add_backend(MemoryBackend* backend) {
    if (backend) backends_.push_back(backend);
}

std::shared_ptr<std::mutex> MemoryManager::lock_for(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = user_locks_[user_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

// ── Records ─────────────────────────────────────────────────────

std::optional<Memory> MemoryManager::load(const std::string& memory_id) {
    try {
        auto blob = store_.get(memory_key(memory_id));
        if (!blob) return std::nullopt;
        return memory_from_json(nlohmann::json::parse(*blob));
    } catch (const std::exception& e) {
        std::cerr << "[memory] Failed to load " << memory_id << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

std::vector<Memory> MemoryManager::load_all() {
    std::vector<Memory> memories;
    std::vector<std::string> keys;
    try {
        keys = store_.list_keys(kMemoryPrefix);
    } catch (const std::exception& e) {
        std::cerr << "[memory] Could not list memories: " << e.what() << "\n";
        return memories;
    }

    for (const auto& key : keys) {
        auto memory = load(key.substr(kMemoryPrefix.size()));
        if (memory) memories.push_back(std::move(*memory));
    }
    return memories;
}

std::vector<Memory> MemoryManager::list_memories(const std::string& user_id) {
    auto all = load_all();
    std::vector<Memory> owned;
    for (auto& m : all) {
        if (m.user_id == user_id) owned.push_back(std::move(m));
    }
    std::stable_sort(owned.begin(), owned.end(),
                     [](const Memory& a, const Memory& b) { return a.created_at < b.created_at; });
    return owned;
}

std::optional<Memory> MemoryManager::get(const std::string& memory_id) {
    return load(memory_id);
}

std::vector<std::string> MemoryManager::list_users() {
    std::set<std::string> users;
    for (const auto& m : load_all()) users.insert(m.user_id);
    return {users.begin(), users.end()};
}

// ── Writes ──────────────────────────────────────────────────────

Status MemoryManager::store_locked(const Memory& memory) {
    std::string blob;
    try {
        blob = memory_to_json(memory).dump(-1, ' ', false,
                                           nlohmann::json::error_handler_t::replace);
    } catch (const std::exception& e) {
        std::cerr << "[memory] Cannot encode " << memory.id << ": " << e.what() << "\n";
        return Status::StorageFailure;
    }
    if (!store_.set(memory_key(memory.id), blob)) {
        std::cerr << "[memory] Failed to store " << memory.id << "\n";
        return Status::StorageFailure;
    }

    // The record is written; a retry re-indexes it in place
    Status status = Status::Ok;
    for (auto* backend : backends_) {
        bool ok = false;
        try {
            ok = backend->store(memory);
        } catch (const std::exception& e) {
            std::cerr << "[memory] " << backend->backend_name() << ": " << e.what() << "\n";
        }
        if (!ok) {
            std::cerr << "[memory] Backend " << backend->backend_name()
                      << " failed to index " << memory.id << "\n";
            status = Status::StorageFailure;
        }
    }
    bump_generation(memory.user_id);
    return status;
}

Status MemoryManager::store(const Memory& memory) {
    if (memory.user_id.empty() || memory.content.empty() ||
        !(memory.importance >= 0.0 && memory.importance <= 1.0)) {
        return Status::ValidationFailure;
    }

    Memory record = memory;
    if (record.created_at == 0) record.created_at = epoch_millis();
    if (record.last_accessed == 0) record.last_accessed = record.created_at;
    if (record.id.empty()) record.id = make_memory_id(record.user_id, record.created_at);

    Status status;
    {
        auto guard = lock_for(record.user_id);
        std::lock_guard<std::mutex> user_lock(*guard);
        status = store_locked(record);
    }

    if (status == Status::Ok) {
        std::cerr << "[memory] Stored " << record.id << " ("
                  << memory_type_to_string(record.memory_type) << ", importance "
                  << record.importance << ")\n";
        publish_stored(record);
    }
    return status;
}

Status MemoryManager::remove_locked(const std::string& memory_id) {
    Status status = Status::Ok;
    if (!store_.remove(memory_key(memory_id))) {
        std::cerr << "[memory] Failed to remove record " << memory_id << "\n";
        status = Status::StorageFailure;
    }
    for (auto* backend : backends_) {
        bool ok = false;
        try {
            ok = backend->remove(memory_id);
        } catch (const std::exception& e) {
            std::cerr << "[memory] " << backend->backend_name() << ": " << e.what() << "\n";
        }
        if (!ok) {
            std::cerr << "[memory] Backend " << backend->backend_name()
                      << " failed to remove " << memory_id << "\n";
            status = Status::StorageFailure;
        }
    }
    return status;
}

Status MemoryManager::remove(const std::string& memory_id) {
    // An id unknown to the record store may still linger in an index
    auto existing = load(memory_id);
    std::string user_id = existing ? existing->user_id : std::string();
    Status status;
    {
        auto guard = lock_for(user_id);
        std::lock_guard<std::mutex> user_lock(*guard);
        status = remove_locked(memory_id);
        if (existing) bump_generation(user_id);
    }

    if (status == Status::Ok && existing) publish_removed(memory_id, user_id);
    return status;
}

std::optional<Memory> MemoryManager::generate_memory(const std::string& user_id,
                                                     const std::string& conversation_text,
                                                     const std::vector<std::string>& topics) {
    if (user_id.empty()) return std::nullopt;
    const auto& topic_list = topics.empty() ? config_.topics : topics;

    std::optional<std::string> content;
    try {
        content = extractor_.extract(conversation_text, topic_list);
    } catch (const std::exception& e) {
        std::cerr << "[memory] Extractor " << extractor_.name() << " failed: " << e.what() << "\n";
        return std::nullopt;
    }
    if (!content || trim(*content).empty()) return std::nullopt;

    uint64_t now = epoch_millis();
    Memory memory;
    memory.id = make_memory_id(user_id, now);
    memory.user_id = user_id;
    memory.content = *content;
    memory.memory_type = classify_memory_type(memory.content);
    memory.importance = assess_importance(memory.content);
    memory.created_at = now;
    memory.last_accessed = now;
    memory.provenance = kProvenance;

    Status status = store(memory);
    if (status != Status::Ok) {
        std::cerr << "[memory] Generated memory for " << user_id << " not stored: "
                  << status_to_string(status) << "\n";
        return std::nullopt;
    }
    return memory;
}

// ── Retrieval ───────────────────────────────────────────────────

std::vector<ScoredMemory> MemoryManager::gather_candidates(const RecallQuery& query) {
    std::vector<ScoredMemory> candidates;

    if (backends_.empty()) {
        for (auto& m : list_memories(query.user_id)) {
            candidates.push_back(ScoredMemory{std::move(m), kDefaultRelevance});
        }
        return candidates;
    }

    // Over-fetch so filtering still leaves top_k
    uint32_t fetch = std::max<uint32_t>(query.top_k, query.top_k * 2);
    std::unordered_map<std::string, size_t> seen;
    for (auto* backend : backends_) {
        std::vector<ScoredMemory> hits;
        try {
            hits = backend->search(query.user_id, query.query, fetch);
        } catch (const std::exception& e) {
            std::cerr << "[memory] " << backend->backend_name() << " search failed: "
                      << e.what() << "\n";
            continue;
        }

        for (auto& hit : hits) {
            if (hit.memory.user_id != query.user_id) continue;
            auto it = seen.find(hit.memory.id);
            if (it != seen.end()) {
                auto& kept = candidates[it->second];
                kept.relevance = std::max(kept.relevance, hit.relevance);
                continue;
            }

            // Indexes may lag behind removals; the record decides
            auto record = load(hit.memory.id);
            if (!record || record->user_id != query.user_id) continue;

            seen[record->id] = candidates.size();
            candidates.push_back(ScoredMemory{std::move(*record), clamp_unit(hit.relevance)});
        }
    }
    return candidates;
}

std::vector<Memory> MemoryManager::retrieve(const RecallQuery& query) {
    if (query.user_id.empty() || query.top_k == 0) return {};

    std::string key = cache_key(query);
    if (auto cached = cache_lookup(key, query.user_id)) return *cached;

    uint64_t generation = generation_of(query.user_id);
    uint64_t now = epoch_millis();

    struct Ranked {
        Memory memory;
        double score;
    };
    std::vector<Ranked> ranked;
    for (auto& candidate : gather_candidates(query)) {
        const auto& m = candidate.memory;
        if (!query.memory_types.empty() &&
            std::find(query.memory_types.begin(), query.memory_types.end(),
                      m.memory_type) == query.memory_types.end()) {
            continue;
        }
        if (m.importance < query.min_importance) continue;
        uint64_t age = age_of(m, now);
        if (query.max_age_days && age / kMillisPerDay > *query.max_age_days) continue;

        double score = blended_score(m.importance, candidate.relevance, recency_score(age));
        ranked.push_back(Ranked{std::move(candidate.memory), score});
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Ranked& a, const Ranked& b) { return a.score > b.score; });
    if (ranked.size() > query.top_k) ranked.resize(query.top_k);

    std::vector<Memory> results;
    results.reserve(ranked.size());
    for (auto& r : ranked) {
        r.memory.last_accessed = now;
        results.push_back(std::move(r.memory));
    }

    std::cerr << "[memory] Retrieved " << results.size() << " memories for "
              << query.user_id << "\n";
    cache_insert(key, generation, results);
    return results;
}

std::vector<Memory> MemoryManager::retrieve_context(const std::string& user_id,
                                                    const std::string& query,
                                                    uint32_t top_k) {
    RecallQuery q;
    q.user_id = user_id;
    q.query = query;
    q.top_k = top_k > 0 ? top_k : config_.max_memories_per_query;
    q.memory_types = {MemoryType::Declarative, MemoryType::Procedural};
    q.min_importance = config_.importance_threshold;
    return retrieve(q);
}

std::string MemoryManager::format_context(const std::vector<Memory>& memories) {
    if (memories.empty()) return "";

    std::ostringstream ss;
    ss << "[Memory context]\n";
    for (const auto& m : memories) {
        ss << "- (" << memory_type_to_string(m.memory_type) << ", "
           << std::fixed << std::setprecision(2) << m.importance << ") "
           << m.content << "\n";
    }
    ss << "[/Memory context]\n";
    return ss.str();
}

// ── Consolidation ───────────────────────────────────────────────

Status MemoryManager::consolidate(const std::string& user_id) {
    ConsolidationReport report;
    return consolidate(user_id, report);
}

Status MemoryManager::consolidate(const std::string& user_id, ConsolidationReport& report) {
    report = ConsolidationReport{};
    std::vector<std::string> removed;

    {
        auto guard = lock_for(user_id);
        std::lock_guard<std::mutex> user_lock(*guard);

        auto memories = list_memories(user_id);
        report.examined = memories.size();

        auto drop = [&](const Memory& m) {
            if (remove_locked(m.id) == Status::Ok) {
                removed.push_back(m.id);
                return true;
            }
            report.failures++;
            return false;
        };

        // Greedy grouping in creation order; each group keeps its max (importance, created_at)
        std::vector<bool> grouped(memories.size(), false);
        std::vector<Memory> survivors;
        for (size_t i = 0; i < memories.size(); ++i) {
            if (grouped[i]) continue;
            grouped[i] = true;
            std::vector<size_t> group = {i};
            for (size_t j = i + 1; j < memories.size(); ++j) {
                if (!grouped[j] && similarity_.is_duplicate(memories[i], memories[j])) {
                    grouped[j] = true;
                    group.push_back(j);
                }
            }

            size_t best = group.front();
            for (size_t idx : group) {
                const auto& a = memories[idx];
                const auto& b = memories[best];
                if (a.importance > b.importance ||
                    (a.importance == b.importance && a.created_at > b.created_at)) {
                    best = idx;
                }
            }
            for (size_t idx : group) {
                if (idx == best) continue;
                if (drop(memories[idx])) report.duplicates_removed++;
            }
            survivors.push_back(memories[best]);
        }

        if (conflicts_) {
            for (const auto& [a, b] : conflicts_->find_conflicts(survivors)) {
                if (a >= survivors.size() || b >= survivors.size()) continue;
                report.conflicts.emplace_back(survivors[a].id, survivors[b].id);
                std::cerr << "[memory] Conflict between " << survivors[a].id << " and "
                          << survivors[b].id << " left unresolved\n";
            }
        }

        uint64_t now = epoch_millis();
        uint64_t max_age = static_cast<uint64_t>(config_.prune_age_days) * kMillisPerDay;
        for (const auto& m : survivors) {
            if (m.importance < config_.prune_importance && age_of(m, now) > max_age) {
                if (drop(m)) report.pruned++;
            }
        }

        if (!removed.empty()) bump_generation(user_id);
    }

    for (const auto& id : removed) publish_removed(id, user_id);

    std::cerr << "[memory] Consolidated " << user_id << ": " << report.examined
              << " examined, " << report.duplicates_removed << " duplicates, "
              << report.pruned << " pruned, " << report.conflicts.size() << " conflicts\n";
    return report.failures == 0 ? Status::Ok : Status::StorageFailure;
}

// ── Query cache ─────────────────────────────────────────────────

uint64_t MemoryManager::generation_of(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = generations_.find(user_id);
    return it == generations_.end() ? 0 : it->second;
}

void MemoryManager::bump_generation(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    generations_[user_id]++;
}

std::optional<std::vector<Memory>> MemoryManager::cache_lookup(const std::string& key,
                                                               const std::string& user_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = query_cache_.find(key);
    if (it == query_cache_.end()) return std::nullopt;

    auto gen = generations_.find(user_id);
    uint64_t current = gen == generations_.end() ? 0 : gen->second;
    if (it->second.generation != current) return std::nullopt;
    return it->second.results;
}

void MemoryManager::cache_insert(const std::string& key, uint64_t generation,
                                 std::vector<Memory> results) {
    if (config_.cache_max_entries == 0) return;

    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = query_cache_.find(key);
    if (it != query_cache_.end()) {
        it->second = CacheEntry{generation, std::move(results)};
        return;
    }

    query_cache_.emplace(key, CacheEntry{generation, std::move(results)});
    cache_order_.push_back(key);
    while (query_cache_.size() > config_.cache_max_entries && !cache_order_.empty()) {
        query_cache_.erase(cache_order_.front());
        cache_order_.pop_front();
    }
}

size_t MemoryManager::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return query_cache_.size();
}

// ── Events ──────────────────────────────────────────────────────

void MemoryManager::publish_stored(const Memory& memory) {
    if (!event_bus_) return;
    MemoryStoredEvent ev;
    ev.memory_id = memory.id;
    ev.user_id = memory.user_id;
    event_bus_->publish(ev);
}

void MemoryManager::publish_removed(const std::string& memory_id, const std::string& user_id) {
    if (!event_bus_) return;
    MemoryRemovedEvent ev;
    ev.memory_id = memory_id;
    ev.user_id = user_id;
    event_bus_->publish(ev);
}

} // namespace memora
