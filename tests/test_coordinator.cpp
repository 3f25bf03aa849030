#include <catch2/catch_test_macros.hpp>
#include "coordinator.hpp"
#include "engine.hpp"
#include "event_bus.hpp"
#include "extractor.hpp"
#include "memory_manager.hpp"
#include "pii.hpp"
#include "session_manager.hpp"
#include "similarity.hpp"
#include "store/file_store.hpp"
#include "task_queue.hpp"
#include "temp_path.hpp"
#include "util.hpp"

using namespace memora;

static constexpr uint64_t kHour = 3600ULL * 1000ULL;
static constexpr uint64_t kDay = 24 * kHour;

// Declaration order matters: the queue is destroyed (drained) before the
// managers its tasks point at.
struct CoordinatorFixture {
    TempPath dir{"coordinator"};
    FileStore store{dir.path};
    PiiRedactor redactor;
    KeywordExtractor extractor;
    TokenJaccard similarity;
    EventBus bus;
    SessionManager sessions{store, redactor, SessionConfig{}};
    MemoryManager memories{store, extractor, similarity, MemoryConfig{}};
    TaskQueue tasks{2, 64};
    Coordinator coordinator{tasks, sessions, memories, bus};

    CoordinatorFixture() {
        sessions.set_event_bus(&bus);
        sessions.set_task_queue(&tasks);
        memories.set_event_bus(&bus);
    }
};

static Memory make_memory(const std::string& user, const std::string& content) {
    Memory m;
    m.user_id = user;
    m.content = content;
    m.importance = 0.6;
    return m;
}

// ── Generation ──────────────────────────────────────────────────

TEST_CASE("Coordinator: append schedules memory generation", "[coordinator]") {
    CoordinatorFixture f;
    auto s = f.sessions.create_session("u1");

    REQUIRE(f.sessions.append(s.id, "u1", Role::User,
                              "My personal preference is window seats") == Status::Ok);
    f.tasks.wait_idle();

    REQUIRE(f.coordinator.generations_scheduled() == 1);
    auto memories = f.memories.list_memories("u1");
    REQUIRE(memories.size() == 1);
    REQUIRE(memories[0].content == "My personal preference is window seats");
    REQUIRE(memories[0].provenance == "conversation_etl");
}

TEST_CASE("Coordinator: unrelated conversation leaves no memory", "[coordinator]") {
    CoordinatorFixture f;
    auto s = f.sessions.create_session("u1");
    f.sessions.append(s.id, "u1", Role::User, "hello there");
    f.sessions.append(s.id, "u1", Role::Assistant, "hi, what can I do?");
    f.tasks.wait_idle();

    REQUIRE(f.coordinator.generations_scheduled() == 2);
    REQUIRE(f.memories.list_memories("u1").empty());
}

TEST_CASE("Coordinator: generation uses redacted text", "[coordinator]") {
    CoordinatorFixture f;
    auto s = f.sessions.create_session("u1");
    f.sessions.append(s.id, "u1", Role::User,
                      "Important facts: my contact email is ada@example.com");
    f.tasks.wait_idle();

    auto memories = f.memories.list_memories("u1");
    REQUIRE(memories.size() == 1);
    REQUIRE(memories[0].content.find("ada@example.com") == std::string::npos);
    REQUIRE(memories[0].content.find("[EMAIL]") != std::string::npos);
}

TEST_CASE("Coordinator: ended session generates nothing", "[coordinator]") {
    CoordinatorFixture f;
    auto s = f.sessions.create_session("u1");
    f.sessions.append(s.id, "u1", Role::User, "no topic here");
    f.tasks.wait_idle();
    REQUIRE(f.sessions.end_session(s.id, "u1") == Status::Ok);

    REQUIRE(f.coordinator.schedule_generation(s.id, "u1", 99));
    f.tasks.wait_idle();
    REQUIRE(f.memories.list_memories("u1").empty());
    REQUIRE(f.tasks.failed() == 0);
}

// ── Maintenance ─────────────────────────────────────────────────

TEST_CASE("Coordinator: sweep archives idle sessions", "[coordinator]") {
    CoordinatorFixture f;
    auto s = f.sessions.create_session("u1");

    REQUIRE(f.coordinator.schedule_sweep(epoch_millis() + 8 * kDay));
    f.tasks.wait_idle();
    REQUIRE_FALSE(f.sessions.get_session(s.id, "u1").has_value());
}

TEST_CASE("Coordinator: consolidation honours the interval", "[coordinator]") {
    CoordinatorFixture f;
    REQUIRE(f.memories.store(make_memory("u1", "likes rowing")) == Status::Ok);
    REQUIRE(f.memories.store(make_memory("u2", "likes climbing")) == Status::Ok);

    uint64_t now = epoch_millis();
    REQUIRE(f.coordinator.run_maintenance(now) == 3);
    REQUIRE(f.coordinator.run_maintenance(now + kHour) == 1);
    REQUIRE(f.coordinator.run_maintenance(now + 25 * kHour) == 3);
    f.tasks.wait_idle();

    REQUIRE(f.tasks.failed() == 0);
    REQUIRE(f.memories.list_memories("u1").size() == 1);
}

TEST_CASE("Coordinator: consolidation task merges duplicates", "[coordinator]") {
    CoordinatorFixture f;
    f.memories.store(make_memory("u1", "favourite food is ramen"));
    f.memories.store(make_memory("u1", "Favourite food is ramen."));

    REQUIRE(f.coordinator.schedule_consolidation("u1"));
    f.tasks.wait_idle();
    REQUIRE(f.memories.list_memories("u1").size() == 1);
}

TEST_CASE("Coordinator: destruction unsubscribes", "[coordinator]") {
    TempPath dir("coordinator_unsub");
    FileStore store(dir.path);
    PiiRedactor redactor;
    KeywordExtractor extractor;
    TokenJaccard similarity;
    EventBus bus;
    SessionManager sessions(store, redactor, SessionConfig{});
    MemoryManager memories(store, extractor, similarity, MemoryConfig{});
    TaskQueue tasks(1, 8);
    {
        Coordinator coordinator(tasks, sessions, memories, bus);
        REQUIRE(bus.subscriber_count(MessageAppendedEvent::TAG) == 1);
    }
    REQUIRE(bus.subscriber_count(MessageAppendedEvent::TAG) == 0);
}

// ── Engine wiring ───────────────────────────────────────────────

TEST_CASE("Engine: conversation to recalled memory", "[coordinator]") {
    TempPath dir("engine");
    Config config;
    config.store.backend = "sqlite";
    config.store.path = dir.path + "/store.db";
    config.memory.path = dir.path;
    config.memory.backends = {"sqlite"};

    Engine engine(config);
    auto s = engine.create_session("u1", "You are helpful.");
    REQUIRE(engine.append(s.id, "u1", Role::User,
                          "My personal preference is window seats") == Status::Ok);
    engine.drain();

    auto context = engine.retrieve_context("u1", "window seats");
    REQUIRE(context.size() == 1);
    REQUIRE(context[0].content == "My personal preference is window seats");
    REQUIRE(engine.retrieve_context("u2", "window seats").empty());

    auto history = engine.history(s.id, "u1");
    REQUIRE(history.size() == 2);
    REQUIRE(engine.end_session(s.id, "u1") == Status::Ok);
    REQUIRE(engine.append(s.id, "u1", Role::User, "still there?") == Status::NotFound);
}

TEST_CASE("Engine: from_transcript stores directly", "[coordinator]") {
    TempPath dir("engine_transcript");
    Config config;
    config.store.backend = "file";
    config.store.path = dir.path + "/store";
    config.memory.path = dir.path;
    config.memory.backends = {"json"};

    Engine engine(config);
    auto id = engine.from_transcript("u1", "User goals: learn to sail this summer", {});
    REQUIRE(id.has_value());
    REQUIRE(engine.memories().get(id.value_or("")).has_value());
    REQUIRE_FALSE(engine.from_transcript("u1", "nothing relevant", {"travel plans"}).has_value());
}
