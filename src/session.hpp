#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace memora {

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

// nullopt for anything outside the four known roles
std::optional<Role> role_from_string(const std::string& s);

struct Message {
    std::string id;
    Role role = Role::User;
    std::string content;               // redacted before first persistence
    uint64_t timestamp = 0;            // epoch ms
    std::optional<nlohmann::json> tool_calls;
    std::optional<nlohmann::json> tool_responses;
};

// Transitions only move forward: Active -> Inactive -> Archived.
enum class SessionStatus { Active, Inactive, Archived };

const char* status_to_string(SessionStatus status);
std::optional<SessionStatus> session_status_from_string(const std::string& s);

// True when `to` is the same as or later than `from` in the lifecycle.
inline bool can_transition(SessionStatus from, SessionStatus to) {
    return static_cast<int>(to) >= static_cast<int>(from);
}

struct Session {
    std::string id;
    std::string user_id;
    uint64_t created_at = 0;           // epoch ms
    uint64_t last_accessed = 0;        // epoch ms
    SessionStatus status = SessionStatus::Active;
    std::vector<Message> history;
    nlohmann::json metadata = nlohmann::json::object();
};

Message make_message(Role role, const std::string& content);

} // namespace memora
