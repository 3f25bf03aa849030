#pragma once
#include "config.hpp"
#include "session.hpp"
#include "status.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <cstdint>

namespace memora {

class EventBus;      // forward declaration
class KeyValueStore; // forward declaration
class PiiRedactor;   // forward declaration
class TaskQueue;     // forward declaration

// Short-term conversation state: owns every Session and its Messages.
//
// Access control: a session is visible only to its owner and only while
// active; anything else is reported exactly like a missing session.
// Mutations of one session are serialized by a per-session mutex, so the
// token budget and message order hold under concurrent turns.
//
// The store, redactor, event bus and task queue must outlive the manager.
// Tasks it submits capture `this`: shut the queue down before destroying it.
class SessionManager {
public:
    SessionManager(KeyValueStore& store, const PiiRedactor& redactor,
                   SessionConfig config);

    // Optional collaborators
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }
    void set_task_queue(TaskQueue* tasks) { tasks_ = tasks; }

    // New active session, optionally seeded with one system message.
    // Throws std::runtime_error if it cannot be persisted.
    Session create_session(const std::string& user_id,
                           const std::string& initial_context = "");

    // Owner-checked lookup of an active session (returns a copy).
    std::optional<Session> get_session(const std::string& session_id,
                                       const std::string& user_id);

    // Redact, append, enforce the token budget, persist.
    Status add_message(const std::string& session_id, const std::string& user_id,
                       Message message);

    // add_message with a fresh id and timestamp
    Status append(const std::string& session_id, const std::string& user_id,
                  Role role, const std::string& content);

    // Last `limit` messages (0 = all). Empty when not accessible.
    std::vector<Message> get_history(const std::string& session_id,
                                     const std::string& user_id,
                                     size_t limit = 0);

    // User and assistant message contents joined by spaces, the input
    // for memory generation. nullopt when not accessible.
    std::optional<std::string> transcript(const std::string& session_id,
                                          const std::string& user_id);

    // Active -> inactive; evicts the session from the cache.
    Status end_session(const std::string& session_id, const std::string& user_id);

    // Archive every non-archived session idle since before now - ttl_days.
    // Per-session failures are logged and skipped. Returns the number archived.
    size_t sweep_expired(uint64_t now_ms, uint32_t ttl_days);

    // Ids of all stored sessions owned by user_id, any status.
    std::vector<std::string> list_sessions(const std::string& user_id);

    size_t cached_count() const;
    // Entries in the per-session lock table; only sessions with an
    // operation in flight hold one.
    size_t lock_count() const;
    const SessionConfig& config() const { return config_; }

private:
    class SessionLock;

    std::shared_ptr<std::mutex> lock_for(const std::string& session_id);
    void release_lock(const std::string& session_id, std::shared_ptr<std::mutex>& guard);

    // Fills the cache on a miss and schedules a write-back of last_accessed.
    // Must not be called with the session lock held.
    std::optional<Session> find_accessible(const std::string& session_id,
                                           const std::string& user_id);
    // Caller holds the session lock. Never writes; sets from_storage on a cache miss.
    std::optional<Session> lookup_locked(const std::string& session_id,
                                         const std::string& user_id,
                                         bool& from_storage);
    std::optional<Session> load(const std::string& session_id);
    bool persist(const Session& session);
    void schedule_write_back(const std::string& session_id);

    KeyValueStore& store_;
    const PiiRedactor& redactor_;
    SessionConfig config_;
    EventBus* event_bus_ = nullptr;
    TaskQueue* tasks_ = nullptr;

    std::unordered_map<std::string, Session> cache_;
    mutable std::mutex cache_mutex_;

    std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_locks_;
    mutable std::mutex locks_mutex_;
};

} // namespace memora
