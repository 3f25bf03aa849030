#include "coordinator.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "memory_manager.hpp"
#include "session_manager.hpp"
#include "status.hpp"
#include "task_queue.hpp"
#include <iostream>

namespace memora {

static constexpr uint64_t kMillisPerHour = 3600ULL * 1000ULL;

Coordinator::Coordinator(TaskQueue& tasks, SessionManager& sessions,
                         MemoryManager& memories, EventBus& bus)
    : tasks_(tasks), sessions_(sessions), memories_(memories), bus_(bus)
{
    subscription_ = subscribe<MessageAppendedEvent>(bus_,
        std::function<void(const MessageAppendedEvent&)>(
            [this](const MessageAppendedEvent& ev) {
                schedule_generation(ev.session_id, ev.user_id, ev.turn);
            }));
}

Coordinator::~Coordinator() {
    bus_.unsubscribe(subscription_);
}

bool Coordinator::schedule_generation(const std::string& session_id,
                                      const std::string& user_id, uint64_t turn) {
    bool accepted = tasks_.submit(TaskId{session_id, turn}, [this, session_id, user_id, turn]() {
        auto text = sessions_.transcript(session_id, user_id);
        if (!text) {
            std::cerr << "[coordinator] " << session_id << "#" << turn
                      << ": session no longer accessible, nothing generated\n";
            return;
        }
        if (text->empty()) return;

        auto memory = memories_.generate_memory(user_id, *text, memories_.config().topics);
        if (memory) {
            std::cerr << "[coordinator] " << session_id << "#" << turn
                      << ": generated " << memory->id << "\n";
        }
    });
    if (accepted) generations_scheduled_++;
    return accepted;
}

bool Coordinator::schedule_consolidation(const std::string& user_id) {
    return tasks_.submit(TaskId{"consolidate:" + user_id, 0}, [this, user_id]() {
        Status status = memories_.consolidate(user_id);
        if (status != Status::Ok) {
            std::cerr << "[coordinator] Consolidation for " << user_id << ": "
                      << status_to_string(status) << "\n";
        }
    });
}

bool Coordinator::schedule_sweep(uint64_t now_ms) {
    return tasks_.submit(TaskId{"sweep", now_ms}, [this, now_ms]() {
        sessions_.sweep_expired(now_ms, sessions_.config().ttl_days);
    });
}

size_t Coordinator::run_maintenance(uint64_t now_ms) {
    size_t scheduled = schedule_sweep(now_ms) ? 1 : 0;

    uint64_t interval = static_cast<uint64_t>(memories_.config().consolidation_interval_hours) *
                        kMillisPerHour;
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
        if (consolidated_once_ && now_ms < last_consolidation_ + interval) return scheduled;
        consolidated_once_ = true;
        last_consolidation_ = now_ms;
    }

    for (const auto& user_id : memories_.list_users()) {
        if (schedule_consolidation(user_id)) scheduled++;
    }
    return scheduled;
}

} // namespace memora
