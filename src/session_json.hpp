#pragma once
#include "session.hpp"
#include <nlohmann/json.hpp>

namespace memora {

// Persisted session document format. Bump when the layout changes;
// decoding a different version throws instead of guessing.
constexpr int kSessionSchemaVersion = 1;

nlohmann::json message_to_json(const Message& msg);
Message message_from_json(const nlohmann::json& item);

nlohmann::json session_to_json(const Session& session);

// Throws std::runtime_error on a schema version mismatch, a missing
// required field, or an unknown role/status.
Session session_from_json(const nlohmann::json& item);

} // namespace memora
