#pragma once

#include <modelspace/model/Payload.hpp>

#include <cstdint>
#include <functional>
#include <unordered_set>

namespace MS {

class Entity;

using WatcherHandle  = std::uint64_t;
using WatchPredicate = std::function<bool(Entity const&)>;
// Receives the entity the predicate was evaluated for and the payload that
// triggered the evaluation (null for the pass run at registration).
using WatchCallback = std::function<void(Entity&, Payload const&)>;

struct WatcherRecord {
    WatchPredicate predicate;
    WatchCallback  onTrue;
    WatchCallback  onFalseAfterTrue;
    // Entities for which the predicate is currently latched true.
    std::unordered_set<EntityId> matched;
};

} // namespace MS
