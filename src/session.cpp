#include "session.hpp"
#include "util.hpp"

namespace memora {

std::optional<Role> role_from_string(const std::string& s) {
    if (s == "system")    return Role::System;
    if (s == "user")      return Role::User;
    if (s == "assistant") return Role::Assistant;
    if (s == "tool")      return Role::Tool;
    return std::nullopt;
}

const char* status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active:   return "active";
        case SessionStatus::Inactive: return "inactive";
        case SessionStatus::Archived: return "archived";
    }
    return "active";
}

std::optional<SessionStatus> session_status_from_string(const std::string& s) {
    if (s == "active")   return SessionStatus::Active;
    if (s == "inactive") return SessionStatus::Inactive;
    if (s == "archived") return SessionStatus::Archived;
    return std::nullopt;
}

Message make_message(Role role, const std::string& content) {
    Message msg;
    msg.id = "msg_" + generate_id();
    msg.role = role;
    msg.content = content;
    msg.timestamp = epoch_millis();
    return msg;
}

} // namespace memora
