#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>
#include <memory>

namespace memora {

struct Config; // forward declaration

enum class MemoryType { Declarative, Procedural };

struct Memory {
    std::string id;
    std::string user_id;
    std::string content;
    MemoryType memory_type = MemoryType::Declarative;
    double importance = 0.5;         // always within [0, 1]
    uint64_t created_at = 0;         // epoch ms
    uint64_t last_accessed = 0;      // epoch ms
    std::string provenance;
    std::set<std::string> tags;
    std::set<std::string> related_memories;  // soft references by id
};

// A search hit from a retrieval backend. relevance is within [0, 1].
struct ScoredMemory {
    Memory memory;
    double relevance = 0.5;
};

// Relevance assumed for candidates no backend scored
constexpr double kDefaultRelevance = 0.5;

std::string memory_type_to_string(MemoryType type);
std::optional<MemoryType> memory_type_from_string(const std::string& s);

// ── Heuristics ──────────────────────────────────────────────────

// Procedural when the text mentions a process ("how to", "steps to", ...).
MemoryType classify_memory_type(const std::string& content);

// 0.5 base, +0.2 per importance keyword occurrence (max 1.0), averaged
// with min(1, length / 500). Result is within [0, 1].
double assess_importance(const std::string& content);

// 1 / (1 + age_hours / 24): 1.0 when new, 0.5 after a day, toward 0 after.
double recency_score(uint64_t age_ms);

// 0.4 importance + 0.4 relevance + 0.2 recency
double blended_score(double importance, double relevance, double recency);

double clamp_unit(double value);

// ── Retrieval backends ──────────────────────────────────────────

// Search index over memories (full-text, vector, graph, ...). The memory
// manager keeps the authoritative records; a backend only has to answer
// search() for what it was given through store().
class MemoryBackend {
public:
    virtual ~MemoryBackend() = default;

    virtual std::string backend_name() const = 0;

    // Index or re-index a memory. Returns false on failure.
    virtual bool store(const Memory& memory) = 0;

    // Up to top_k of the user's memories matching query, best first.
    virtual std::vector<ScoredMemory> search(const std::string& user_id,
                                             const std::string& query,
                                             uint32_t top_k) = 0;

    // Drop a memory from the index. Removing a missing id succeeds.
    virtual bool remove(const std::string& memory_id) = 0;
};

// Build the backends listed in config.memory.backends ("sqlite", "json").
// Unknown names are logged and skipped. Throws if a backend cannot open.
std::vector<std::unique_ptr<MemoryBackend>> create_memory_backends(const Config& config);

} // namespace memora
