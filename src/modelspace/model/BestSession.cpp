#include <modelspace/model/BestSession.hpp>

namespace MS {

auto selectBestSessionId(SessionMap const& sessions, SessionKeys const& keys) -> SessionId {
    SessionId best                  = 0;
    bool      foundOfficialSoftware = false;

    for (auto const& [sessionId, session] : sessions) {
        if (session.isOffline(keys)) {
            continue;
        }
        bool useThis = false;
        if (session.flags.officialSoftware) {
            if (!foundOfficialSoftware) {
                foundOfficialSoftware = true;
                useThis               = true;
            } else if (sessionId > best) {
                useThis = true;
            }
        } else if (!foundOfficialSoftware && sessionId > best) {
            useThis = true;
        }
        if (useThis) {
            best = sessionId;
        }
    }
    return best;
}

} // namespace MS
