#pragma once

#include <modelspace/core/Options.hpp>
#include <modelspace/model/Payload.hpp>

#include <map>
#include <string>

namespace MS {

/**
 * Booleans derived from a session's "flags" bitmask. Only best-session
 * selection and the true-private query read them; they are never diffed.
 */
struct SessionFlags {
    bool truePrivate      = false;
    bool guestsMuted      = false;
    bool basicsMuted      = false;
    bool officialSoftware = false;

    static auto fromBits(std::int64_t bits) -> SessionFlags;

    auto operator==(SessionFlags const&) const -> bool = default;
};

/**
 * One state snapshot of an entity. `properties` always holds the session id,
 * entity id, video state and rank keys once the row has been created through
 * withDefaults().
 */
struct Session {
    SessionId      id         = 0;
    nlohmann::json properties = nlohmann::json::object();
    SessionFlags   flags{};

    static auto withDefaults(SessionKeys const& keys, SessionId id, EntityId entity) -> Session;

    // Null when the key is absent.
    [[nodiscard]] auto get(std::string const& key) const -> nlohmann::json;
    [[nodiscard]] auto contains(std::string const& key) const -> bool;
    auto               set(std::string const& key, nlohmann::json value) -> void;

    // A missing or non-integer video state counts as offline.
    [[nodiscard]] auto videoState(SessionKeys const& keys) const -> std::int64_t;
    [[nodiscard]] auto isOffline(SessionKeys const& keys) const -> bool;
};

using SessionMap = std::map<SessionId, Session>;

} // namespace MS
