#pragma once

#include <modelspace/core/Error.hpp>
#include <modelspace/core/Options.hpp>
#include <modelspace/model/Entity.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace MS {

/**
 * @brief Owner of every known Entity, keyed by id.
 *
 * Purpose:
 * - Hand out one stable Entity instance per id; creation happens exactly once
 *   even when several threads ask for a new id at the same time.
 * - Own the aggregate entity (id `options().aggregateId`) that mirrors the
 *   events of all the others.
 *
 * Notes / limitations:
 * - The registry mutex is never held while an entity is locked. find() runs
 *   its predicate over a snapshot, so predicates may query entities freely.
 * - Entities live as long as their registry; references stay valid.
 */
class EntityRegistry {
public:
    explicit EntityRegistry(RegistryOptions options = {});
    ~EntityRegistry();

    EntityRegistry(EntityRegistry const&)            = delete;
    EntityRegistry& operator=(EntityRegistry const&) = delete;

    /**
     * Process-wide registry, configured from the environment on first use
     * (see RegistryOptions::fromEnvironment()).
     */
    static EntityRegistry& Instance();

    auto getOrCreate(EntityId id) -> Entity&;
    // Accepts the decimal id text found in text protocols.
    auto getOrCreate(std::string_view id) -> Expected<Entity*>;
    // nullptr when the id is unknown; never creates.
    [[nodiscard]] auto get(EntityId id) const -> Entity*;
    // Concrete entities matching predicate, never the aggregate.
    [[nodiscard]] auto find(std::function<bool(Entity const&)> const& predicate) const -> std::vector<Entity*>;
    // Every concrete entity, taken under the lock and returned without it.
    [[nodiscard]] auto snapshot() const -> std::vector<Entity*>;

    auto aggregate() -> Entity& { return *aggregate_; }
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto options() const -> RegistryOptions const& { return options_; }

private:
    RegistryOptions                                        options_;
    std::unique_ptr<Entity>                                aggregate_;
    mutable std::mutex                                     mutex_;
    std::unordered_map<EntityId, std::unique_ptr<Entity>> entities_;
};

} // namespace MS
