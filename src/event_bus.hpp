#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <cstdint>

namespace memora {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe between the stores and the coordinator.
// Publishers are on the request path, so a throwing handler is logged and
// skipped rather than propagated to the publisher.
class EventBus {
public:
    // Returns an id for unsubscribe(); ids are never reused.
    uint64_t subscribe(const std::string& tag, EventHandler handler);
    bool unsubscribe(uint64_t id);

    // Call every handler for the event's tag in registration order, with the
    // bus mutex released. Returns the number of handlers that completed.
    size_t publish(const Event& event);

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::string tag;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;   // registration order
    uint64_t last_id_ = 0;
};

// Subscribe with the concrete event type; the tag comes from E::TAG.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    EventHandler erased = [typed = std::move(handler)](const Event& event) {
        typed(static_cast<const E&>(event));
    };
    return bus.subscribe(E::TAG, std::move(erased));
}

} // namespace memora
