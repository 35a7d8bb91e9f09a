#pragma once

#include <modelspace/core/Options.hpp>
#include <modelspace/model/Session.hpp>

namespace MS {

/**
 * @brief Picks the authoritative session among an entity's sessions.
 *
 * Offline sessions never qualify. Sessions broadcast from the official
 * model software outrank every other session; within each class the highest
 * session id wins. Returns 0 when no session qualifies.
 */
[[nodiscard]] auto selectBestSessionId(SessionMap const& sessions, SessionKeys const& keys) -> SessionId;

} // namespace MS
