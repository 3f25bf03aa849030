#pragma once
#include "memory.hpp"
#include <nlohmann/json.hpp>

namespace memora {

// Persisted memory document format, versioned like sessions.
constexpr int kMemorySchemaVersion = 1;

nlohmann::json memory_to_json(const Memory& memory);

// Throws std::runtime_error on a schema version mismatch, a missing
// field, an unknown memory_type, or importance outside [0, 1].
Memory memory_from_json(const nlohmann::json& item);

} // namespace memora
