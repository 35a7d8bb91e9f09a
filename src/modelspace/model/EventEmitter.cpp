#include <modelspace/model/EventEmitter.hpp>

#include <algorithm>

namespace MS {

auto EventFilter::matches(Event const& event) const -> bool {
    switch (this->kind) {
    case Kind::All:
        return true;
    case Kind::Property:
        if (auto const* changed = std::get_if<PropertyChanged>(&event)) {
            return changed->name == this->propertyName;
        }
        return false;
    case Kind::Any:
        return std::holds_alternative<AnyChanged>(event);
    case Kind::Tags:
        return std::holds_alternative<TagsChanged>(event);
    }
    return false;
}

auto EventEmitter::subscribe(EventFilter filter, EventHandler handler) -> SubscriptionId {
    std::lock_guard<std::mutex> lock(mutex_);
    auto const id = nextId_++;
    subscriptions_.push_back(Subscription{id, std::move(filter), std::make_shared<EventHandler>(std::move(handler))});
    return id;
}

auto EventEmitter::unsubscribe(SubscriptionId id) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](Subscription const& sub) { return sub.id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

auto EventEmitter::publish(Entity& source, Event const& event) -> void {
    std::vector<std::shared_ptr<EventHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const& sub : subscriptions_) {
            if (sub.handler && *sub.handler && sub.filter.matches(event)) {
                handlers.push_back(sub.handler);
            }
        }
    }
    for (auto const& handler : handlers) {
        (*handler)(source, event);
    }
}

auto EventEmitter::subscriberCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

auto EventEmitter::clear() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.clear();
}

} // namespace MS
