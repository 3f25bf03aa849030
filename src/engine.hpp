#pragma once
#include "config.hpp"
#include "coordinator.hpp"
#include "event_bus.hpp"
#include "extractor.hpp"
#include "memory.hpp"
#include "memory_manager.hpp"
#include "pii.hpp"
#include "session_manager.hpp"
#include "similarity.hpp"
#include "store.hpp"
#include "task_queue.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace memora {

// Owns and wires every service for one process: store, redactor,
// managers, retrieval backends, task queue and coordinator.
// Destruction drains the task queue before anything it references goes.
class Engine {
public:
    // Throws std::runtime_error when a store or backend cannot be opened.
    explicit Engine(const Config& config);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ── Conversation interface ──
    Session create_session(const std::string& user_id,
                           const std::string& initial_context = "");
    Status append(const std::string& session_id, const std::string& user_id,
                  Role role, const std::string& content);
    std::vector<Message> history(const std::string& session_id,
                                 const std::string& user_id, size_t limit = 0);
    Status end_session(const std::string& session_id, const std::string& user_id);

    // ── Memory interface ──
    std::vector<Memory> retrieve_context(const std::string& user_id,
                                         const std::string& query, uint32_t top_k = 0);
    std::optional<std::string> from_transcript(const std::string& user_id,
                                               const std::string& transcript,
                                               const std::vector<std::string>& topics);

    // Block until scheduled background work has finished.
    void drain();

    SessionManager& sessions() { return *sessions_; }
    MemoryManager& memories() { return *memories_; }
    Coordinator& coordinator() { return *coordinator_; }
    TaskQueue& tasks() { return *tasks_; }
    EventBus& events() { return bus_; }
    const PiiRedactor& redactor() const { return redactor_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    std::unique_ptr<KeyValueStore> store_;
    PiiRedactor redactor_;
    KeywordExtractor extractor_;
    TokenJaccard similarity_;
    std::vector<std::unique_ptr<MemoryBackend>> backends_;
    EventBus bus_;
    std::unique_ptr<TaskQueue> tasks_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<MemoryManager> memories_;
    std::unique_ptr<Coordinator> coordinator_;
};

} // namespace memora
