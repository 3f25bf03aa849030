#include "engine.hpp"
#include <iostream>

namespace memora {

Engine::Engine(const Config& config)
    : config_(config),
      store_(create_store(config_)),
      redactor_(config_.pii.extended),
      similarity_(config_.memory.duplicate_threshold),
      backends_(create_memory_backends(config_)),
      tasks_(std::make_unique<TaskQueue>(config_.worker.threads, config_.worker.queue_capacity))
{
    sessions_ = std::make_unique<SessionManager>(*store_, redactor_, config_.session);
    sessions_->set_event_bus(&bus_);
    sessions_->set_task_queue(tasks_.get());

    memories_ = std::make_unique<MemoryManager>(*store_, extractor_, similarity_, config_.memory);
    memories_->set_event_bus(&bus_);
    for (auto& backend : backends_) {
        memories_->add_backend(backend.get());
    }

    coordinator_ = std::make_unique<Coordinator>(*tasks_, *sessions_, *memories_, bus_);

    std::cerr << "[engine] store=" << store_->backend_name()
              << " backends=" << backends_.size()
              << " workers=" << tasks_->workers() << "\n";
}

Engine::~Engine() {
    // Queued tasks reference the managers below
    tasks_->shutdown();
    coordinator_.reset();
}

Session Engine::create_session(const std::string& user_id, const std::string& initial_context) {
    return sessions_->create_session(user_id, initial_context);
}

Status Engine::append(const std::string& session_id, const std::string& user_id,
                      Role role, const std::string& content) {
    return sessions_->append(session_id, user_id, role, content);
}

std::vector<Message> Engine::history(const std::string& session_id,
                                     const std::string& user_id, size_t limit) {
    return sessions_->get_history(session_id, user_id, limit);
}

Status Engine::end_session(const std::string& session_id, const std::string& user_id) {
    return sessions_->end_session(session_id, user_id);
}

std::vector<Memory> Engine::retrieve_context(const std::string& user_id,
                                             const std::string& query, uint32_t top_k) {
    return memories_->retrieve_context(user_id, query, top_k);
}

std::optional<std::string> Engine::from_transcript(const std::string& user_id,
                                                   const std::string& transcript,
                                                   const std::vector<std::string>& topics) {
    auto memory = memories_->generate_memory(user_id, transcript, topics);
    if (!memory) return std::nullopt;
    return memory->id;
}

void Engine::drain() {
    tasks_->wait_idle();
}

} // namespace memora
