#include "event_bus.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace memora {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.push_back(Subscription{++last_id_, tag, std::move(handler)});
    return last_id_;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subscriptions_.end()) return false;
    subscriptions_.erase(it);
    return true;
}

size_t EventBus::publish(const Event& event) {
    // Snapshot so handlers may (un)subscribe while being called
    std::vector<EventHandler> matching;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& s : subscriptions_) {
            if (s.tag == event.type_tag) matching.push_back(s.handler);
        }
    }

    size_t delivered = 0;
    for (const auto& handler : matching) {
        try {
            handler(event);
            delivered++;
        } catch (const std::exception& e) {
            std::cerr << "[events] " << event.type_tag << " handler failed: "
                      << e.what() << "\n";
        }
    }
    return delivered;
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(
        subscriptions_.begin(), subscriptions_.end(),
        [&tag](const Subscription& s) { return s.tag == tag; }));
}

} // namespace memora
