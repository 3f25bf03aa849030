#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <cstdint>

namespace memora {

class EventBus;        // forward declaration
class MemoryManager;   // forward declaration
class SessionManager;  // forward declaration
class TaskQueue;       // forward declaration

// Moves memory work off the conversational path. Every appended message
// schedules one generation task keyed {session, turn}; maintenance
// (expiry sweep, consolidation) is scheduled the same way. Outcomes of
// scheduled work are logged, never reported back to the caller.
//
// All references must outlive the coordinator, and the task queue must be
// drained (shutdown) before the managers are destroyed.
class Coordinator {
public:
    Coordinator(TaskQueue& tasks, SessionManager& sessions,
                MemoryManager& memories, EventBus& bus);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Generate a memory from the session's transcript in the background.
    bool schedule_generation(const std::string& session_id,
                             const std::string& user_id, uint64_t turn);

    bool schedule_consolidation(const std::string& user_id);
    bool schedule_sweep(uint64_t now_ms);

    // Sweep now; consolidate every user with memories when the configured
    // interval has passed since the last round. Returns tasks scheduled.
    size_t run_maintenance(uint64_t now_ms);

    uint64_t generations_scheduled() const { return generations_scheduled_.load(); }

private:
    TaskQueue& tasks_;
    SessionManager& sessions_;
    MemoryManager& memories_;
    EventBus& bus_;
    uint64_t subscription_ = 0;

    std::mutex maintenance_mutex_;
    uint64_t last_consolidation_ = 0;
    bool consolidated_once_ = false;

    std::atomic<uint64_t> generations_scheduled_{0};
};

} // namespace memora
