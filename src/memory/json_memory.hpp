#pragma once
#include "../memory.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <unordered_map>

namespace memora {

// Retrieval backend kept in a single JSON file. Relevance is the share of
// query words that appear as whole words in the memory content.
class JsonMemory : public MemoryBackend {
public:
    explicit JsonMemory(const std::string& path);

    std::string backend_name() const override { return "json"; }

    bool store(const Memory& memory) override;

    std::vector<ScoredMemory> search(const std::string& user_id,
                                     const std::string& query,
                                     uint32_t top_k) override;

    bool remove(const std::string& memory_id) override;

    size_t size() const;

private:
    void load();
    bool save();
    void rebuild_index();

    std::string path_;
    std::vector<Memory> entries_;
    std::unordered_map<std::string, size_t> id_index_; // id -> entries_ index
    mutable std::mutex mutex_;
};

// Fraction of query tokens found among content tokens, in [0, 1].
double token_overlap(const std::vector<std::string>& query_tokens,
                     const std::string& content);

} // namespace memora
