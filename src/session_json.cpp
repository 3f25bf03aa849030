#include "session_json.hpp"
#include "util.hpp"
#include <stdexcept>

namespace memora {

static std::string required_string(const nlohmann::json& item, const char* field) {
    if (!item.contains(field) || !item[field].is_string()) {
        throw std::runtime_error(std::string("missing field '") + field + "'");
    }
    return item[field].get<std::string>();
}

static uint64_t required_time(const nlohmann::json& item, const char* field) {
    auto ts = parse_timestamp(required_string(item, field));
    if (!ts) throw std::runtime_error(std::string("bad timestamp in '") + field + "'");
    return *ts;
}

nlohmann::json message_to_json(const Message& msg) {
    nlohmann::json item = {
        {"id", msg.id},
        {"role", role_to_string(msg.role)},
        {"content", msg.content},
        {"timestamp", format_timestamp(msg.timestamp)},
        {"tool_calls", msg.tool_calls ? *msg.tool_calls : nlohmann::json(nullptr)},
        {"tool_responses", msg.tool_responses ? *msg.tool_responses : nlohmann::json(nullptr)}
    };
    return item;
}

Message message_from_json(const nlohmann::json& item) {
    Message msg;
    msg.id = required_string(item, "id");
    auto role = role_from_string(required_string(item, "role"));
    if (!role) throw std::runtime_error("unknown role in message " + msg.id);
    msg.role = *role;
    msg.content = item.value("content", "");
    msg.timestamp = required_time(item, "timestamp");
    if (item.contains("tool_calls") && !item["tool_calls"].is_null())
        msg.tool_calls = item["tool_calls"];
    if (item.contains("tool_responses") && !item["tool_responses"].is_null())
        msg.tool_responses = item["tool_responses"];
    return msg;
}

nlohmann::json session_to_json(const Session& session) {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& msg : session.history) {
        history.push_back(message_to_json(msg));
    }
    return {
        {"schema_version", kSessionSchemaVersion},
        {"id", session.id},
        {"user_id", session.user_id},
        {"created_at", format_timestamp(session.created_at)},
        {"last_accessed", format_timestamp(session.last_accessed)},
        {"status", status_to_string(session.status)},
        {"history", std::move(history)},
        {"metadata", session.metadata.is_object() ? session.metadata
                                                  : nlohmann::json::object()}
    };
}

Session session_from_json(const nlohmann::json& item) {
    if (!item.is_object()) throw std::runtime_error("session document is not an object");

    int version = item.value("schema_version", 0);
    if (version != kSessionSchemaVersion) {
        throw std::runtime_error("unsupported session schema version " +
                                 std::to_string(version));
    }

    Session session;
    session.id = required_string(item, "id");
    session.user_id = required_string(item, "user_id");
    session.created_at = required_time(item, "created_at");
    session.last_accessed = required_time(item, "last_accessed");

    auto status = session_status_from_string(required_string(item, "status"));
    if (!status) throw std::runtime_error("unknown status in session " + session.id);
    session.status = *status;

    if (item.contains("history") && item["history"].is_array()) {
        for (const auto& m : item["history"]) {
            session.history.push_back(message_from_json(m));
        }
    }
    if (item.contains("metadata") && item["metadata"].is_object()) {
        session.metadata = item["metadata"];
    }
    return session;
}

} // namespace memora
