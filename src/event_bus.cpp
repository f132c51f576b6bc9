#include "event_bus.hpp"

namespace shellhost {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    for (auto& [tag, subs] : handlers_) {
        for (auto it = subs.begin(); it != subs.end(); ++it) {
            if (it->id == id) {
                subs.erase(it);
                return true;
            }
        }
    }
    return false;
}

void EventBus::publish(const Event& event) {
    auto it = handlers_.find(event.type_tag);
    if (it == handlers_.end()) return;
    // Snapshot: a handler may subscribe or unsubscribe mid-dispatch.
    std::vector<EventHandler> to_call;
    to_call.reserve(it->second.size());
    for (const auto& sub : it->second) {
        to_call.push_back(sub.handler);
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
}

void EventBus::clear() {
    handlers_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace shellhost
