#include <modelspace/model/Session.hpp>

#include <modelspace/core/VideoState.hpp>

namespace MS {

auto SessionFlags::fromBits(std::int64_t bits) -> SessionFlags {
    SessionFlags flags;
    flags.truePrivate      = (bits & SessionFlag::TruePrivate) != 0;
    flags.guestsMuted      = (bits & SessionFlag::GuestsMuted) != 0;
    flags.basicsMuted      = (bits & SessionFlag::BasicsMuted) != 0;
    flags.officialSoftware = (bits & SessionFlag::OfficialSoftware) != 0;
    return flags;
}

auto Session::withDefaults(SessionKeys const& keys, SessionId id, EntityId entity) -> Session {
    Session session;
    session.id                          = id;
    session.properties[keys.sessionId]  = id;
    session.properties[keys.entityId]   = entity;
    session.properties[keys.videoState] = toInteger(VideoState::Offline);
    session.properties[keys.rank]       = 0;
    return session;
}

auto Session::get(std::string const& key) const -> nlohmann::json {
    if (auto it = this->properties.find(key); it != this->properties.end()) {
        return *it;
    }
    return nullptr;
}

auto Session::contains(std::string const& key) const -> bool {
    return this->properties.contains(key);
}

auto Session::set(std::string const& key, nlohmann::json value) -> void {
    this->properties[key] = std::move(value);
}

auto Session::videoState(SessionKeys const& keys) const -> std::int64_t {
    return readInteger(this->properties, keys.videoState).value_or(toInteger(VideoState::Offline));
}

auto Session::isOffline(SessionKeys const& keys) const -> bool {
    return this->videoState(keys) == toInteger(VideoState::Offline);
}

} // namespace MS
