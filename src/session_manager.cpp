#include "session_manager.hpp"
#include "context_window.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "pii.hpp"
#include "session_json.hpp"
#include "store.hpp"
#include "task_queue.hpp"
#include "util.hpp"
#include <iostream>
#include <stdexcept>

namespace memora {

static constexpr uint64_t kMillisPerDay = 86400ULL * 1000ULL;
static const std::string kSessionPrefix = "session/";

SessionManager::SessionManager(KeyValueStore& store, const PiiRedactor& redactor,
                               SessionConfig config)
    : store_(store), redactor_(redactor), config_(config)
{}

// Holds one session's mutex for a scope. On release the lock table entry is
// dropped unless another operation on the same session still references it.
class SessionManager::SessionLock {
public:
    SessionLock(SessionManager& owner, const std::string& session_id)
        : owner_(owner), session_id_(session_id), mutex_(owner.lock_for(session_id)) {
        mutex_->lock();
    }
    ~SessionLock() {
        mutex_->unlock();
        owner_.release_lock(session_id_, mutex_);
    }
    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;

private:
    SessionManager& owner_;
    std::string session_id_;
    std::shared_ptr<std::mutex> mutex_;
};

std::shared_ptr<std::mutex> SessionManager::lock_for(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = session_locks_[session_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void SessionManager::release_lock(const std::string& session_id,
                                  std::shared_ptr<std::mutex>& guard) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    guard.reset();
    auto it = session_locks_.find(session_id);
    if (it != session_locks_.end() && it->second.use_count() == 1) {
        session_locks_.erase(it);
    }
}

size_t SessionManager::lock_count() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return session_locks_.size();
}

std::optional<Session> SessionManager::load(const std::string& session_id) {
    try {
        auto blob = store_.get(session_key(session_id));
        if (!blob) return std::nullopt;
        return session_from_json(nlohmann::json::parse(*blob));
    } catch (const std::exception& e) {
        std::cerr << "[session] Failed to load " << session_id << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

bool SessionManager::persist(const Session& session) {
    try {
        // Replace invalid UTF-8 rather than failing the write
        std::string blob = session_to_json(session).dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (store_.set(session_key(session.id), blob)) return true;
        std::cerr << "[session] Failed to store " << session.id << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[session] Failed to store " << session.id << ": " << e.what() << "\n";
    }
    return false;
}

void SessionManager::schedule_write_back(const std::string& session_id) {
    auto write_back = [this, session_id]() {
        SessionLock session_lock(*this, session_id);

        // Persist whatever is current, not the snapshot that triggered this
        std::optional<Session> current;
        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            auto it = cache_.find(session_id);
            if (it != cache_.end()) current = it->second;
        }
        if (current) persist(*current);
    };

    if (!tasks_) {
        write_back();
        return;
    }
    tasks_->submit(TaskId{"write-back:" + session_id, epoch_millis()}, std::move(write_back));
}

Session SessionManager::create_session(const std::string& user_id,
                                       const std::string& initial_context) {
    uint64_t now = epoch_millis();

    Session session;
    session.id = "session_" + generate_id();
    session.user_id = user_id;
    session.created_at = now;
    session.last_accessed = now;
    session.status = SessionStatus::Active;
    if (!initial_context.empty()) {
        session.history.push_back(make_message(Role::System, initial_context));
    }

    if (!persist(session)) {
        throw std::runtime_error("cannot persist new session for user " + user_id);
    }
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_[session.id] = session;
    }

    if (event_bus_) {
        SessionCreatedEvent ev;
        ev.session_id = session.id;
        ev.user_id = user_id;
        event_bus_->publish(ev);
    }
    return session;
}

std::optional<Session> SessionManager::lookup_locked(const std::string& session_id,
                                                     const std::string& user_id,
                                                     bool& from_storage) {
    from_storage = false;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(session_id);
        if (it != cache_.end()) {
            if (it->second.user_id != user_id || it->second.status != SessionStatus::Active) {
                return std::nullopt;
            }
            return it->second;
        }
    }

    auto session = load(session_id);
    if (!session || session->user_id != user_id ||
        session->status != SessionStatus::Active) {
        return std::nullopt;
    }
    from_storage = true;
    return session;
}

std::optional<Session> SessionManager::find_accessible(const std::string& session_id,
                                                       const std::string& user_id) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(session_id);
        if (it != cache_.end()) {
            if (it->second.user_id != user_id || it->second.status != SessionStatus::Active) {
                return std::nullopt;
            }
            return it->second;
        }
    }

    // Miss: load under the session lock so a concurrent append cannot be
    // overwritten by the older stored copy.
    std::optional<Session> session;
    bool from_storage = false;
    {
        SessionLock session_lock(*this, session_id);
        session = lookup_locked(session_id, user_id, from_storage);
        if (session && from_storage) {
            session->last_accessed = epoch_millis();
            std::lock_guard<std::mutex> lock(cache_mutex_);
            cache_.emplace(session_id, *session);
        }
    }
    if (session && from_storage) schedule_write_back(session_id);
    return session;
}

std::optional<Session> SessionManager::get_session(const std::string& session_id,
                                                   const std::string& user_id) {
    return find_accessible(session_id, user_id);
}

Status SessionManager::add_message(const std::string& session_id,
                                   const std::string& user_id,
                                   Message message) {
    if (message.content.empty() && !message.tool_calls && !message.tool_responses) {
        return Status::ValidationFailure;
    }
    if (message.id.empty()) message.id = "msg_" + generate_id();
    if (message.timestamp == 0) message.timestamp = epoch_millis();

    uint64_t turn = 0;
    {
        SessionLock session_lock(*this, session_id);

        bool from_storage = false;
        auto session = lookup_locked(session_id, user_id, from_storage);
        if (!session) return Status::NotFound;

        if (config_.enable_pii_redaction) {
            message.content = redactor_.redact(message.content);
        }

        session->history.push_back(std::move(message));
        size_t dropped = manage_context_window(session->history, config_.max_token_limit);
        if (dropped > 0) {
            std::cerr << "[session] " << session_id << ": dropped " << dropped
                      << " messages over the " << config_.max_token_limit << "-token budget\n";
        }

        session->last_accessed = epoch_millis();
        turn = session->metadata.value("message_count", uint64_t{0}) + 1;
        session->metadata["message_count"] = turn;

        if (!persist(*session)) return Status::StorageFailure;
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_[session_id] = *session;
    }

    // Published after the session lock is released; handlers may append.
    if (event_bus_) {
        MessageAppendedEvent ev;
        ev.session_id = session_id;
        ev.user_id = user_id;
        ev.turn = turn;
        event_bus_->publish(ev);
    }
    return Status::Ok;
}

Status SessionManager::append(const std::string& session_id, const std::string& user_id,
                              Role role, const std::string& content) {
    return add_message(session_id, user_id, make_message(role, content));
}

std::vector<Message> SessionManager::get_history(const std::string& session_id,
                                                 const std::string& user_id,
                                                 size_t limit) {
    auto session = find_accessible(session_id, user_id);
    if (!session) return {};

    auto& history = session->history;
    if (limit > 0 && limit < history.size()) {
        history.erase(history.begin(),
                      history.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return std::move(history);
}

std::optional<std::string> SessionManager::transcript(const std::string& session_id,
                                                      const std::string& user_id) {
    auto session = find_accessible(session_id, user_id);
    if (!session) return std::nullopt;

    std::string text;
    for (const auto& msg : session->history) {
        if (msg.role != Role::User && msg.role != Role::Assistant) continue;
        if (!text.empty()) text += ' ';
        text += msg.content;
    }
    return text;
}

Status SessionManager::end_session(const std::string& session_id,
                                   const std::string& user_id) {
    {
        SessionLock session_lock(*this, session_id);

        bool from_storage = false;
        auto session = lookup_locked(session_id, user_id, from_storage);
        if (!session) return Status::NotFound;

        session->status = SessionStatus::Inactive;
        session->last_accessed = epoch_millis();
        if (!persist(*session)) return Status::StorageFailure;

        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_.erase(session_id);
    }

    if (event_bus_) {
        SessionEndedEvent ev;
        ev.session_id = session_id;
        ev.user_id = user_id;
        event_bus_->publish(ev);
    }
    return Status::Ok;
}

size_t SessionManager::sweep_expired(uint64_t now_ms, uint32_t ttl_days) {
    uint64_t ttl_ms = static_cast<uint64_t>(ttl_days) * kMillisPerDay;
    uint64_t cutoff = now_ms > ttl_ms ? now_ms - ttl_ms : 0;

    std::vector<std::string> keys;
    try {
        keys = store_.list_keys(kSessionPrefix);
    } catch (const std::exception& e) {
        std::cerr << "[session] Sweep could not list sessions: " << e.what() << "\n";
        return 0;
    }

    size_t archived = 0;
    for (const auto& key : keys) {
        std::string session_id = key.substr(kSessionPrefix.size());
        std::string owner;
        {
            SessionLock session_lock(*this, session_id);

            // The cached copy is never older than the stored one
            std::optional<Session> session;
            {
                std::lock_guard<std::mutex> lock(cache_mutex_);
                auto it = cache_.find(session_id);
                if (it != cache_.end()) session = it->second;
            }
            if (!session) session = load(session_id);
            if (!session) {
                std::cerr << "[session] Sweep skipped unreadable session " << session_id << "\n";
                continue;
            }
            if (session->status == SessionStatus::Archived || session->last_accessed >= cutoff) {
                continue;
            }

            session->status = SessionStatus::Archived;
            if (!persist(*session)) {
                std::cerr << "[session] Sweep failed to archive " << session_id << "\n";
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(cache_mutex_);
                cache_.erase(session_id);
            }
            owner = session->user_id;
        }
        archived++;

        if (event_bus_) {
            SessionArchivedEvent ev;
            ev.session_id = session_id;
            ev.user_id = owner;
            event_bus_->publish(ev);
        }
    }

    if (archived > 0) {
        std::cerr << "[session] Archived " << archived << " expired sessions\n";
    }
    return archived;
}

std::vector<std::string> SessionManager::list_sessions(const std::string& user_id) {
    std::vector<std::string> ids;
    std::vector<std::string> keys;
    try {
        keys = store_.list_keys(kSessionPrefix);
    } catch (const std::exception& e) {
        std::cerr << "[session] Could not list sessions: " << e.what() << "\n";
        return ids;
    }

    for (const auto& key : keys) {
        std::string session_id = key.substr(kSessionPrefix.size());
        auto session = load(session_id);
        if (session && session->user_id == user_id) ids.push_back(session_id);
    }
    return ids;
}

size_t SessionManager::cached_count() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

} // namespace memora
