#include <modelspace/model/Entity.hpp>

#include <modelspace/core/VideoState.hpp>
#include <modelspace/model/BestSession.hpp>
#include <modelspace/model/EntityRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace MS {

Entity::Entity(EntityRegistry& registry, EntityId id)
    : registry_(registry), id_(id) {}

auto Entity::keys() const -> SessionKeys const& {
    return registry_.options().keys;
}

auto Entity::isAggregate() const -> bool {
    return id_ == registry_.options().aggregateId;
}

auto Entity::displayName() const -> std::optional<std::string> {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return displayName_;
}

auto Entity::tags() const -> std::set<std::string> {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return tags_;
}

auto Entity::sessionIds() const -> std::vector<SessionId> {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<SessionId>                ids;
    ids.reserve(sessions_.size());
    for (auto const& [sessionId, session] : sessions_) {
        ids.push_back(sessionId);
    }
    return ids;
}

auto Entity::session(SessionId id) const -> std::optional<Session> {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (auto it = sessions_.find(id); it != sessions_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Entity::bestSessionId() const -> SessionId {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return selectBestSessionId(sessions_, this->keys());
}

auto Entity::bestSession() const -> Session {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto const best = this->bestSessionId();
    if (auto it = sessions_.find(best); it != sessions_.end()) {
        return it->second;
    }
    return Session::withDefaults(this->keys(), best, id_);
}

auto Entity::videoState() const -> std::int64_t {
    return this->bestSession().videoState(this->keys());
}

auto Entity::inTruePrivate() const -> bool {
    auto const best = this->bestSession();
    return best.videoState(this->keys()) == toInteger(VideoState::Private) && best.flags.truePrivate;
}

auto Entity::merge(Payload const& payload) -> Expected<void> {
    if (this->isAggregate()) {
        ms_log("Entity::merge rejected for the aggregate entity", "Merge", "ERROR");
        return std::unexpected(Error{Error::Code::PreconditionFailed, "cannot merge into the aggregate entity"});
    }
    if (!payload.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "payload must be a JSON object"});
    }
    auto const& keys = this->keys();
    if (auto it = payload.find(keys.level); it != payload.end() && *it != nlohmann::json(registry_.options().expectedLevel)) {
        ms_log("Entity::merge rejected payload with level " + it->dump() + " for entity " + std::to_string(id_), "Merge", "ERROR");
        return std::unexpected(Error{Error::Code::PreconditionFailed, keys.level + " " + it->dump() + " is not the model level"});
    }
    SessionId targetId = 0;
    if (auto it = payload.find(keys.sessionId); it != payload.end()) {
        auto parsed = readInteger(*it);
        if (!parsed) {
            return std::unexpected(Error{Error::Code::MalformedInput, keys.sessionId + " must be an integer"});
        }
        targetId = *parsed;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto const baseline = this->bestSession();
    auto [targetIt, created] = sessions_.try_emplace(targetId, Session::withDefaults(keys, targetId, id_));
    auto& target             = targetIt->second;

    std::vector<PendingChange> changes;
    auto                       apply = [&](std::string const& key, nlohmann::json const& value) {
        changes.push_back(PendingChange{key, baseline.get(key), value});
        target.set(key, value);
    };

    for (auto const& [key, value] : payload.items()) {
        if (!value.is_object()) {
            apply(key, value);
            continue;
        }
        for (auto const& [innerKey, innerValue] : value.items()) {
            apply(innerKey, innerValue);
            if (innerKey == keys.flags) {
                if (auto bits = readInteger(innerValue)) {
                    target.flags = SessionFlags::fromBits(*bits);
                }
            }
        }
    }

    // Moving to another session clears whatever the previous one had and this one lacks.
    if (target.id != baseline.id) {
        for (auto const& [key, value] : baseline.properties.items()) {
            if (!target.contains(key)) {
                changes.push_back(PendingChange{key, value, nullptr});
            }
        }
    }

    auto const bestAfter = this->bestSessionId();
    bool const visible   = bestAfter == target.id || (target.id != 0 && (baseline.id == 0 || bestAfter == 0));

    ms_log("Entity " + std::to_string(id_) + " merged session " + std::to_string(targetId) + (created ? " (new)" : "") + " "
               + std::string(videoStateToString(static_cast<VideoState>(target.videoState(keys)))) + " best " + std::to_string(baseline.id) + "->" + std::to_string(bestAfter) + (visible ? " visible" : " hidden"),
           "Merge");

    if (visible) {
        auto const best = this->bestSession();
        if (auto name = best.get(keys.name); name.is_string()) {
            auto value = name.get<std::string>();
            if (displayName_ != value) {
                displayName_ = std::move(value);
            }
        }
        for (auto& change : changes) {
            if (change.before != change.after) {
                this->emit(PropertyChanged{std::move(change.name), std::move(change.before), std::move(change.after)});
            }
        }
        this->emit(AnyChanged{payload});
        this->processWatchers(payload);
    }
    this->purgeOfflineSessions();
    return {};
}

auto Entity::mergeTags(std::vector<std::string> const& newTags) -> Expected<void> {
    if (this->isAggregate()) {
        ms_log("Entity::mergeTags rejected for the aggregate entity", "Merge", "ERROR");
        return std::unexpected(Error{Error::Code::PreconditionFailed, "cannot merge tags into the aggregate entity"});
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto previous = tags_;
    tags_.insert(newTags.begin(), newTags.end());
    this->emit(TagsChanged{std::move(previous), tags_});
    this->processWatchers(nlohmann::json(newTags));
    return {};
}

auto Entity::mergeTags(Payload const& newTags) -> Expected<void> {
    if (!newTags.is_array()) {
        ms_log("Entity::mergeTags rejected " + newTags.dump() + " for entity " + std::to_string(id_), "Merge", "ERROR");
        return std::unexpected(Error{Error::Code::MalformedInput, "tags must be a JSON array"});
    }
    std::vector<std::string> tags;
    tags.reserve(newTags.size());
    for (auto const& tag : newTags) {
        if (!tag.is_string()) {
            return std::unexpected(Error{Error::Code::TypeMismatch, "tag " + tag.dump() + " is not a string"});
        }
        tags.push_back(tag.get<std::string>());
    }
    return this->mergeTags(tags);
}

auto Entity::reset() -> void {
    if (this->isAggregate()) {
        for (auto* entity : registry_.snapshot()) {
            entity->reset();
        }
        return;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto const& keys = this->keys();
    auto const  best = this->bestSessionId();
    for (auto& [sessionId, session] : sessions_) {
        if (sessionId != best && !session.isOffline(keys)) {
            session.set(keys.videoState, toInteger(VideoState::Offline));
        }
    }

    Payload blank = Payload::object();
    blank[keys.sessionId]  = best;
    blank[keys.entityId]   = id_;
    blank[keys.videoState] = toInteger(VideoState::Offline);
    if (auto result = this->merge(blank); !result) {
        ms_log("Entity::reset failed for " + std::to_string(id_) + ": " + describeError(result.error()), "Entity", "ERROR");
    }
}

auto Entity::emit(Event const& event) -> void {
    emitter_.publish(*this, event);
    if (!this->isAggregate()) {
        registry_.aggregate().events().publish(*this, event);
    }
}

auto Entity::purgeOfflineSessions() -> void {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto const& keys = this->keys();
    std::erase_if(sessions_, [&keys](auto const& entry) { return entry.second.isOffline(keys); });
}

auto Entity::toJson() const -> nlohmann::json {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    nlohmann::json json = nlohmann::json::object();
    json["name"]        = displayName_ ? nlohmann::json(*displayName_) : nlohmann::json(nullptr);
    json["id"]          = id_;
    json["tags"]        = nlohmann::json::array();
    for (auto const& tag : tags_) {
        json["tags"].push_back(tag);
    }
    json["bestSession"] = this->bestSession().properties;
    return json;
}

auto Entity::describe() const -> std::string {
    return this->toJson().dump();
}

} // namespace MS
