#pragma once
#include "event.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shellhost {

using EventHandler = std::function<void(const Event&)>;

// In-process publish/subscribe between components and the host bridge.
// Lives on the event loop thread, so there is no locking. Handlers may
// publish further events or (un)subscribe while being dispatched.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish synchronously. Handlers are called in registration order;
    // the handler list is snapshotted before the first call.
    void publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Unsubscribes on destruction. Useful for test observers and for
// components that outlive a shorter-lived bus client.
class ScopedSubscription {
public:
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { if (bus_) bus_->unsubscribe(id_); }

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : bus_(other.bus_), id_(other.id_) { other.bus_ = nullptr; }
    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(ScopedSubscription&&) = delete;

private:
    EventBus* bus_;
    uint64_t id_;
};

} // namespace shellhost
