#include <catch2/catch_test_macros.hpp>
#include "event_bus.hpp"
#include <stdexcept>

using namespace memora;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(SessionCreatedEvent::TAG, [&](const Event&) {
        count++;
    });

    SessionCreatedEvent ev;
    ev.session_id = "s1";
    REQUIRE(bus.publish(ev) == 1);
    REQUIRE(count == 1);
}

TEST_CASE("EventBus: handlers run in registration order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(MemoryStoredEvent::TAG, [&](const Event&) { order.push_back(1); });
    bus.subscribe(MemoryStoredEvent::TAG, [&](const Event&) { order.push_back(2); });

    MemoryStoredEvent ev;
    bus.publish(ev);
    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    SessionEndedEvent ev;
    REQUIRE(bus.publish(ev) == 0);
}

TEST_CASE("EventBus: tags are independent", "[event_bus]") {
    EventBus bus;
    int created = 0;
    int ended = 0;
    bus.subscribe(SessionCreatedEvent::TAG, [&](const Event&) { created++; });
    bus.subscribe(SessionEndedEvent::TAG, [&](const Event&) { ended++; });

    SessionCreatedEvent ev;
    bus.publish(ev);
    REQUIRE(created == 1);
    REQUIRE(ended == 0);
}

// ── Typed helper ────────────────────────────────────────────────

TEST_CASE("EventBus: typed subscribe sees concrete fields", "[event_bus]") {
    EventBus bus;
    std::string seen_session;
    uint64_t seen_turn = 0;

    subscribe<MessageAppendedEvent>(bus, std::function<void(const MessageAppendedEvent&)>(
        [&](const MessageAppendedEvent& ev) {
            seen_session = ev.session_id;
            seen_turn = ev.turn;
        }));

    MessageAppendedEvent ev;
    ev.session_id = "session_1";
    ev.user_id = "u1";
    ev.turn = 4;
    bus.publish(ev);

    REQUIRE(seen_session == "session_1");
    REQUIRE(seen_turn == 4);
}

// ── Unsubscribe / failures ──────────────────────────────────────

TEST_CASE("EventBus: unsubscribe stops delivery", "[event_bus]") {
    EventBus bus;
    int count = 0;
    auto id = bus.subscribe(MemoryRemovedEvent::TAG, [&](const Event&) { count++; });
    REQUIRE(bus.subscriber_count(MemoryRemovedEvent::TAG) == 1);

    REQUIRE(bus.unsubscribe(id));
    REQUIRE_FALSE(bus.unsubscribe(id));
    REQUIRE(bus.subscriber_count(MemoryRemovedEvent::TAG) == 0);

    MemoryRemovedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 0);
}

TEST_CASE("EventBus: throwing handler does not stop the others", "[event_bus]") {
    EventBus bus;
    int later = 0;
    bus.subscribe(SessionArchivedEvent::TAG, [](const Event&) {
        throw std::runtime_error("handler failed");
    });
    bus.subscribe(SessionArchivedEvent::TAG, [&](const Event&) { later++; });

    SessionArchivedEvent ev;
    REQUIRE(bus.publish(ev) == 1);
    REQUIRE(later == 1);
}

TEST_CASE("EventBus: handler may subscribe during publish", "[event_bus]") {
    EventBus bus;
    int added_calls = 0;
    bus.subscribe(SessionCreatedEvent::TAG, [&](const Event&) {
        bus.subscribe(SessionCreatedEvent::TAG, [&](const Event&) { added_calls++; });
    });

    SessionCreatedEvent ev;
    bus.publish(ev);
    REQUIRE(added_calls == 0);
    REQUIRE(bus.subscriber_count(SessionCreatedEvent::TAG) == 2);
}
