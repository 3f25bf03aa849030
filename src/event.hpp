#pragma once
#include <string>
#include <cstdint>

namespace memora {

// Events are dispatched by tag string, no RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* SessionCreated  = "SessionCreated";
    constexpr const char* MessageAppended = "MessageAppended";
    constexpr const char* SessionEnded    = "SessionEnded";
    constexpr const char* SessionArchived = "SessionArchived";
    constexpr const char* MemoryStored    = "MemoryStored";
    constexpr const char* MemoryRemoved   = "MemoryRemoved";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct SessionCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionCreated;
    std::string session_id;
    std::string user_id;

    SessionCreatedEvent() { type_tag = TAG; }
};

// Published after a message is persisted. `turn` is the session's
// message counter after the append.
struct MessageAppendedEvent : Event {
    static constexpr const char* TAG = event_tags::MessageAppended;
    std::string session_id;
    std::string user_id;
    uint64_t turn = 0;

    MessageAppendedEvent() { type_tag = TAG; }
};

struct SessionEndedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionEnded;
    std::string session_id;
    std::string user_id;

    SessionEndedEvent() { type_tag = TAG; }
};

struct SessionArchivedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionArchived;
    std::string session_id;
    std::string user_id;

    SessionArchivedEvent() { type_tag = TAG; }
};

struct MemoryStoredEvent : Event {
    static constexpr const char* TAG = event_tags::MemoryStored;
    std::string memory_id;
    std::string user_id;

    MemoryStoredEvent() { type_tag = TAG; }
};

struct MemoryRemovedEvent : Event {
    static constexpr const char* TAG = event_tags::MemoryRemoved;
    std::string memory_id;
    std::string user_id;

    MemoryRemovedEvent() { type_tag = TAG; }
};

} // namespace memora
