#include <modelspace/model/EntityRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <charconv>
#include <vector>
#include <string>

namespace MS {

EntityRegistry::EntityRegistry(RegistryOptions options)
    : options_(std::move(options)) {
    aggregate_ = std::make_unique<Entity>(*this, options_.aggregateId);
}

EntityRegistry::~EntityRegistry() = default;

EntityRegistry& EntityRegistry::Instance() {
    static EntityRegistry instance{RegistryOptions::fromEnvironment()};
    return instance;
}

auto EntityRegistry::getOrCreate(EntityId id) -> Entity& {
    if (id == options_.aggregateId) {
        return *aggregate_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entities_.try_emplace(id);
    if (inserted) {
        it->second = std::make_unique<Entity>(*this, id);
        ms_log("EntityRegistry: created entity " + std::to_string(id), "Registry");
    }
    return *it->second;
}

auto EntityRegistry::getOrCreate(std::string_view id) -> Expected<Entity*> {
    EntityId parsed{};
    auto const* end    = id.data() + id.size();
    auto        result = std::from_chars(id.data(), end, parsed);
    if (id.empty() || result.ec != std::errc{} || result.ptr != end) {
        return std::unexpected(Error{Error::Code::MalformedInput, "entity id '" + std::string(id) + "' is not an integer"});
    }
    return &this->getOrCreate(parsed);
}

auto EntityRegistry::get(EntityId id) const -> Entity* {
    if (id == options_.aggregateId) {
        return aggregate_.get();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = entities_.find(id); it != entities_.end()) {
        return it->second.get();
    }
    return nullptr;
}

auto EntityRegistry::find(std::function<bool(Entity const&)> const& predicate) const -> std::vector<Entity*> {
    auto matches = this->snapshot();
    std::erase_if(matches, [&](Entity* entity) { return !predicate(*entity); });
    return matches;
}

auto EntityRegistry::snapshot() const -> std::vector<Entity*> {
    std::vector<Entity*>        entities;
    std::lock_guard<std::mutex> lock(mutex_);
    entities.reserve(entities_.size());
    for (auto const& [id, entity] : entities_) {
        entities.push_back(entity.get());
    }
    return entities;
}

auto EntityRegistry::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entities_.size();
}

} // namespace MS
