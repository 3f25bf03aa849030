#pragma once
#include "../memory.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace memora {

// Full-text retrieval backend: an FTS5 index over memory content, ranked
// by bm25 and mapped onto [0, 1] relevance.
class SqliteMemory : public MemoryBackend {
public:
    explicit SqliteMemory(const std::string& path);
    ~SqliteMemory() override;

    // Non-copyable
    SqliteMemory(const SqliteMemory&) = delete;
    SqliteMemory& operator=(const SqliteMemory&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    bool store(const Memory& memory) override;

    std::vector<ScoredMemory> search(const std::string& user_id,
                                     const std::string& query,
                                     uint32_t top_k) override;

    bool remove(const std::string& memory_id) override;

    uint32_t count();

private:
    void init_schema();

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

// FTS5 MATCH expression: alphanumeric tokens of two or more characters,
// each quoted, OR-joined. Empty when the query has no usable token.
std::string build_fts_query(const std::string& query);

// Map a bm25 rank (negative, lower is better) onto [0, 1).
double bm25_relevance(double rank);

} // namespace memora
