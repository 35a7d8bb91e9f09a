#pragma once

#include <modelspace/model/Event.hpp>

#include <memory>
#include <mutex>
#include <vector>

namespace MS {

/**
 * Subscribe/publish hub owned by every entity.
 *
 * - publish() runs matching handlers synchronously on the calling thread,
 *   in subscription order.
 * - The emitter's mutex is released before handlers run, so a handler may
 *   subscribe or unsubscribe (the change applies from the next publish).
 */
class EventEmitter {
public:
    EventEmitter()  = default;
    ~EventEmitter() = default;

    EventEmitter(EventEmitter const&)            = delete;
    EventEmitter& operator=(EventEmitter const&) = delete;

    auto subscribe(EventFilter filter, EventHandler handler) -> SubscriptionId;
    auto unsubscribe(SubscriptionId id) -> bool;
    auto publish(Entity& source, Event const& event) -> void;

    [[nodiscard]] auto subscriberCount() const -> std::size_t;
    auto               clear() -> void;

private:
    struct Subscription {
        SubscriptionId                id = 0;
        EventFilter                   filter;
        std::shared_ptr<EventHandler> handler;
    };

    mutable std::mutex        mutex_;
    std::vector<Subscription> subscriptions_;
    SubscriptionId            nextId_ = 1;
};

} // namespace MS
