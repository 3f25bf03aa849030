#include "memory_json.hpp"
#include "util.hpp"
#include <stdexcept>

namespace memora {

static std::string string_field(const nlohmann::json& item, const char* field) {
    if (!item.contains(field) || !item[field].is_string()) {
        throw std::runtime_error(std::string("memory field '") + field + "' missing");
    }
    return item[field].get<std::string>();
}

static uint64_t time_field(const nlohmann::json& item, const char* field) {
    auto ts = parse_timestamp(string_field(item, field));
    if (!ts) throw std::runtime_error(std::string("memory field '") + field + "' is not a timestamp");
    return *ts;
}

static std::set<std::string> string_set(const nlohmann::json& item, const char* field) {
    std::set<std::string> out;
    if (!item.contains(field) || !item[field].is_array()) return out;
    for (const auto& v : item[field]) {
        if (v.is_string()) out.insert(v.get<std::string>());
    }
    return out;
}

nlohmann::json memory_to_json(const Memory& memory) {
    return {
        {"schema_version", kMemorySchemaVersion},
        {"id", memory.id},
        {"user_id", memory.user_id},
        {"content", memory.content},
        {"memory_type", memory_type_to_string(memory.memory_type)},
        {"importance", memory.importance},
        {"created_at", format_timestamp(memory.created_at)},
        {"last_accessed", format_timestamp(memory.last_accessed)},
        {"provenance", memory.provenance},
        {"tags", memory.tags},
        {"related_memories", memory.related_memories}
    };
}

Memory memory_from_json(const nlohmann::json& item) {
    if (!item.is_object()) throw std::runtime_error("memory document is not an object");

    int version = item.value("schema_version", 0);
    if (version != kMemorySchemaVersion) {
        throw std::runtime_error("unsupported memory schema version " +
                                 std::to_string(version));
    }

    Memory memory;
    memory.id = string_field(item, "id");
    memory.user_id = string_field(item, "user_id");
    memory.content = string_field(item, "content");

    auto type = memory_type_from_string(string_field(item, "memory_type"));
    if (!type) throw std::runtime_error("unknown memory_type in " + memory.id);
    memory.memory_type = *type;

    if (!item.contains("importance") || !item["importance"].is_number()) {
        throw std::runtime_error("memory field 'importance' missing");
    }
    memory.importance = item["importance"].get<double>();
    if (!(memory.importance >= 0.0 && memory.importance <= 1.0)) {
        throw std::runtime_error("importance out of range in " + memory.id);
    }

    memory.created_at = time_field(item, "created_at");
    memory.last_accessed = time_field(item, "last_accessed");
    memory.provenance = item.value("provenance", "");
    memory.tags = string_set(item, "tags");
    memory.related_memories = string_set(item, "related_memories");
    return memory;
}

} // namespace memora
