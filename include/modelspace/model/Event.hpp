#pragma once

#include <modelspace/model/Payload.hpp>

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <variant>

namespace MS {

class Entity;

// A single property of the best session changed value. Null means absent.
struct PropertyChanged {
    std::string    name;
    nlohmann::json before;
    nlohmann::json after;
};

// Fired once for every visible merge, carrying the payload as received.
struct AnyChanged {
    Payload payload;
};

struct TagsChanged {
    std::set<std::string> before;
    std::set<std::string> after;
};

using Event = std::variant<PropertyChanged, AnyChanged, TagsChanged>;

// The first argument is the entity the event is about, also when the event is
// delivered through the aggregate entity.
using EventHandler   = std::function<void(Entity&, Event const&)>;
using SubscriptionId = std::uint64_t;

struct EventFilter {
    enum class Kind {
        All,
        Property,
        Any,
        Tags
    };

    Kind        kind = Kind::All;
    std::string propertyName;

    static auto all() -> EventFilter { return EventFilter{Kind::All, {}}; }
    static auto any() -> EventFilter { return EventFilter{Kind::Any, {}}; }
    static auto tags() -> EventFilter { return EventFilter{Kind::Tags, {}}; }
    static auto property(std::string name) -> EventFilter { return EventFilter{Kind::Property, std::move(name)}; }

    [[nodiscard]] auto matches(Event const& event) const -> bool;
};

} // namespace MS
