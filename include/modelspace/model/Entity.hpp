#pragma once

#include <modelspace/core/Error.hpp>
#include <modelspace/core/Options.hpp>
#include <modelspace/model/EventEmitter.hpp>
#include <modelspace/model/Payload.hpp>
#include <modelspace/model/Session.hpp>
#include <modelspace/model/Watcher.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace MS {

class EntityRegistry;

/**
 * @brief Aggregated state of one remote model across all of her sessions.
 *
 * Every Entity belongs to an EntityRegistry, which owns it and hands out the
 * same instance for the same id. One entity per registry is the aggregate:
 * it never holds sessions, mirrors every event raised by the other entities
 * and evaluates its watchers against each of them.
 *
 * Locking:
 * - All state is guarded by a recursive mutex, so handlers and watcher
 *   callbacks may read or update the entity they are called for.
 * - An entity's own mutex is always taken before the aggregate's mutex.
 *   Aggregate watcher callbacks therefore must not merge into another entity.
 * - Handlers, predicates and callbacks run synchronously on the thread doing
 *   the update, with the entity locked.
 */
class Entity {
public:
    Entity(EntityRegistry& registry, EntityId id);
    ~Entity() = default;

    Entity(Entity const&)            = delete;
    Entity& operator=(Entity const&) = delete;

    [[nodiscard]] auto id() const -> EntityId { return id_; }
    [[nodiscard]] auto isAggregate() const -> bool;

    [[nodiscard]] auto displayName() const -> std::optional<std::string>;
    [[nodiscard]] auto tags() const -> std::set<std::string>;
    [[nodiscard]] auto sessionIds() const -> std::vector<SessionId>;
    [[nodiscard]] auto session(SessionId id) const -> std::optional<Session>;

    /**
     * Applies a partial state update to the session named by the payload's
     * session id (0 when absent). Property events, the catch-all event and
     * watchers only fire when the updated session is the one chosen for
     * display. Offline sessions are dropped afterwards either way.
     *
     * Fails with PreconditionFailed on the aggregate entity or when the
     * payload's level does not match the registry's expected level, and with
     * MalformedInput for a non-object payload or non-integer session id.
     * A failed merge changes nothing.
     */
    auto merge(Payload const& payload) -> Expected<void>;

    // Union of the current tags with newTags. Always raises one TagsChanged.
    auto mergeTags(std::vector<std::string> const& newTags) -> Expected<void>;
    // Same, for a decoded JSON array of strings.
    auto mergeTags(Payload const& newTags) -> Expected<void>;

    // Takes the entity offline and drops every session. On the aggregate,
    // resets every entity of the registry.
    auto reset() -> void;

    [[nodiscard]] auto bestSessionId() const -> SessionId;
    // Copy of the best session, or a defaulted offline row when there is none.
    [[nodiscard]] auto bestSession() const -> Session;
    [[nodiscard]] auto videoState() const -> std::int64_t;
    [[nodiscard]] auto inTruePrivate() const -> bool;

    /**
     * Registers an edge-triggered watcher: onTrue fires when predicate turns
     * true for an entity, onFalseAfterTrue when it turns false again. The
     * predicate is evaluated once right away. Watchers on the aggregate are
     * evaluated for every entity.
     */
    auto when(WatchPredicate predicate, WatchCallback onTrue, WatchCallback onFalseAfterTrue = {}) -> WatcherHandle;
    auto removeWatcher(WatcherHandle handle) -> bool;
    [[nodiscard]] auto watcherCount() const -> std::size_t;

    auto events() -> EventEmitter& { return emitter_; }

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] auto describe() const -> std::string;

private:
    struct PendingChange {
        std::string    name;
        nlohmann::json before;
        nlohmann::json after;
    };

    auto keys() const -> SessionKeys const&;
    auto emit(Event const& event) -> void;
    auto processWatchers(Payload const& payload) -> void;
    auto runWatchers(Entity& subject, Payload const& payload) -> void;
    auto purgeOfflineSessions() -> void;

    EntityRegistry&                        registry_;
    EntityId const                         id_;
    std::optional<std::string>             displayName_;
    std::set<std::string>                  tags_;
    SessionMap                             sessions_;
    std::map<WatcherHandle, WatcherRecord> watchers_;
    WatcherHandle                          nextWatcher_ = 1;
    EventEmitter                           emitter_;
    mutable std::recursive_mutex           mutex_;
};

} // namespace MS
