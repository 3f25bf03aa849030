#include "json_memory.hpp"
#include "../memory_json.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <unordered_set>

namespace memora {

double token_overlap(const std::vector<std::string>& query_tokens,
                     const std::string& content) {
    if (query_tokens.empty()) return 0.0;

    // Whole-word matching so "test" does not match "attest"
    auto words = tokenize(content);
    std::unordered_set<std::string> content_tokens(words.begin(), words.end());

    size_t hits = 0;
    for (const auto& token : query_tokens) {
        if (content_tokens.count(token)) hits++;
    }
    return static_cast<double>(hits) / static_cast<double>(query_tokens.size());
}

JsonMemory::JsonMemory(const std::string& path) : path_(path) {
    load();
}

void JsonMemory::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const std::exception& e) {
        std::cerr << "[memory] json: " << path_ << " is unreadable, starting empty: "
                  << e.what() << "\n";
        return;
    }
    if (!j.is_array()) return;

    entries_.clear();
    entries_.reserve(j.size());
    for (const auto& item : j) {
        try {
            entries_.push_back(memory_from_json(item));
        } catch (const std::exception& e) {
            std::cerr << "[memory] json: skipped entry: " << e.what() << "\n";
        }
    }
    rebuild_index();
}

bool JsonMemory::save() {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : entries_) {
        j.push_back(memory_to_json(entry));
    }
    std::string text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!atomic_write_file(path_, text)) {
        std::cerr << "[memory] json: failed to write " << path_ << "\n";
        return false;
    }
    return true;
}

void JsonMemory::rebuild_index() {
    id_index_.clear();
    id_index_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        id_index_[entries_[i].id] = i;
    }
}

bool JsonMemory::store(const Memory& memory) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = id_index_.find(memory.id);
    if (it != id_index_.end()) {
        entries_[it->second] = memory;
    } else {
        id_index_[memory.id] = entries_.size();
        entries_.push_back(memory);
    }
    return save();
}

std::vector<ScoredMemory> JsonMemory::search(const std::string& user_id,
                                             const std::string& query,
                                             uint32_t top_k) {
    auto tokens = tokenize(query);
    if (tokens.empty() || top_k == 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ScoredMemory> results;
    for (const auto& entry : entries_) {
        if (entry.user_id != user_id) continue;
        double relevance = token_overlap(tokens, entry.content);
        if (relevance > 0.0) {
            results.push_back(ScoredMemory{entry, relevance});
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const ScoredMemory& a, const ScoredMemory& b) {
                         return a.relevance > b.relevance;
                     });
    if (results.size() > top_k) results.resize(top_k);
    return results;
}

bool JsonMemory::remove(const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = id_index_.find(memory_id);
    if (it == id_index_.end()) return true;

    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_index();
    return save();
}

size_t JsonMemory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace memora
