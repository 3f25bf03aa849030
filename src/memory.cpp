#include "memory.hpp"
#include "config.hpp"
#include "memory/json_memory.hpp"
#include "memory/sqlite_memory.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace memora {

static const std::vector<std::string> kProceduralIndicators = {
    "how to", "steps to", "process", "procedure",
    "method", "algorithm", "way to", "technique",
};

static const std::vector<std::string> kImportanceKeywords = {
    "important", "critical", "essential", "key", "must",
    "name", "birthday", "preference", "allergy", "requirement",
};

std::string memory_type_to_string(MemoryType type) {
    switch (type) {
        case MemoryType::Declarative: return "declarative";
        case MemoryType::Procedural:  return "procedural";
    }
    return "declarative";
}

std::optional<MemoryType> memory_type_from_string(const std::string& s) {
    if (s == "declarative") return MemoryType::Declarative;
    if (s == "procedural")  return MemoryType::Procedural;
    return std::nullopt;
}

MemoryType classify_memory_type(const std::string& content) {
    std::string lower = to_lower(content);
    for (const auto& phrase : kProceduralIndicators) {
        if (lower.find(phrase) != std::string::npos) return MemoryType::Procedural;
    }
    return MemoryType::Declarative;
}

double assess_importance(const std::string& content) {
    std::string lower = to_lower(content);

    double importance = 0.5;
    for (const auto& keyword : kImportanceKeywords) {
        importance += 0.2 * static_cast<double>(count_occurrences(lower, keyword));
    }
    importance = std::min(1.0, importance);

    double length_factor = std::min(1.0, static_cast<double>(content.size()) / 500.0);
    return clamp_unit((importance + length_factor) / 2.0);
}

double recency_score(uint64_t age_ms) {
    double age_hours = static_cast<double>(age_ms) / 3600000.0;
    return clamp_unit(1.0 / (1.0 + age_hours / 24.0));
}

double blended_score(double importance, double relevance, double recency) {
    return 0.4 * importance + 0.4 * relevance + 0.2 * recency;
}

double clamp_unit(double value) {
    if (std::isnan(value)) return 0.0;
    return std::max(0.0, std::min(1.0, value));
}

std::vector<std::unique_ptr<MemoryBackend>> create_memory_backends(const Config& config) {
    std::vector<std::unique_ptr<MemoryBackend>> backends;
    std::string dir = config.memory_dir();

    for (const auto& name : config.memory.backends) {
        if (name == "sqlite") {
            backends.push_back(std::make_unique<SqliteMemory>(dir + "/memory.db"));
        } else if (name == "json") {
            backends.push_back(std::make_unique<JsonMemory>(dir + "/memory.json"));
        } else if (name != "none") {
            std::cerr << "[memory] Unknown retrieval backend '" << name << "', skipped\n";
        }
    }
    return backends;
}

} // namespace memora
