#include <modelspace/core/VideoState.hpp>
#include <modelspace/model/BestSession.hpp>

#include <doctest/doctest.h>

using namespace MS;

namespace {

auto makeSession(SessionKeys const& keys, SessionId id, VideoState state, bool official) -> Session {
    auto session = Session::withDefaults(keys, id, 7);
    session.set(keys.videoState, toInteger(state));
    session.flags.officialSoftware = official;
    return session;
}

} // namespace

TEST_SUITE_BEGIN("model.bestsession");

TEST_CASE("no qualifying session selects zero") {
    SessionKeys keys;
    SessionMap  sessions;
    CHECK(selectBestSessionId(sessions, keys) == 0);

    sessions.emplace(3, makeSession(keys, 3, VideoState::Offline, false));
    sessions.emplace(9, makeSession(keys, 9, VideoState::Offline, true));
    CHECK(selectBestSessionId(sessions, keys) == 0);
}

TEST_CASE("highest session id wins among ordinary sessions") {
    SessionKeys keys;
    SessionMap  sessions;
    sessions.emplace(10, makeSession(keys, 10, VideoState::Online, false));
    sessions.emplace(20, makeSession(keys, 20, VideoState::FreeChat, false));
    CHECK(selectBestSessionId(sessions, keys) == 20);
}

TEST_CASE("official software outranks higher ids") {
    SessionKeys keys;
    SessionMap  sessions;
    sessions.emplace(5, makeSession(keys, 5, VideoState::Online, true));
    sessions.emplace(20, makeSession(keys, 20, VideoState::Online, false));
    CHECK(selectBestSessionId(sessions, keys) == 5);

    SUBCASE("highest official id wins") {
        sessions.emplace(8, makeSession(keys, 8, VideoState::Private, true));
        CHECK(selectBestSessionId(sessions, keys) == 8);
    }
    SUBCASE("offline official sessions are skipped") {
        sessions.at(5).set(keys.videoState, toInteger(VideoState::Offline));
        CHECK(selectBestSessionId(sessions, keys) == 20);
    }
}

TEST_CASE("missing or malformed video state counts as offline") {
    SessionKeys keys;
    SessionMap  sessions;
    auto        missing = makeSession(keys, 30, VideoState::Online, false);
    missing.properties.erase(keys.videoState);
    sessions.emplace(30, missing);
    auto text = makeSession(keys, 40, VideoState::Online, false);
    text.set(keys.videoState, "online");
    sessions.emplace(40, text);
    sessions.emplace(2, makeSession(keys, 2, VideoState::Away, false));
    CHECK(selectBestSessionId(sessions, keys) == 2);
}

TEST_CASE("flags bitmask decoding") {
    auto flags = SessionFlags::fromBits(SessionFlag::TruePrivate | SessionFlag::OfficialSoftware);
    CHECK(flags.truePrivate);
    CHECK_FALSE(flags.guestsMuted);
    CHECK_FALSE(flags.basicsMuted);
    CHECK(flags.officialSoftware);

    auto muted = SessionFlags::fromBits(SessionFlag::GuestsMuted | SessionFlag::BasicsMuted | SessionFlag::Bookmark);
    CHECK(muted.guestsMuted);
    CHECK(muted.basicsMuted);
    CHECK_FALSE(muted.truePrivate);
    CHECK_FALSE(muted.officialSoftware);
}

TEST_CASE("default session row") {
    auto keys    = SessionKeys::wire();
    auto session = Session::withDefaults(keys, 12, 99);
    CHECK(session.get("sid").get<std::int64_t>() == 12);
    CHECK(session.get("uid").get<std::int64_t>() == 99);
    CHECK(session.get("vs").get<std::int64_t>() == toInteger(VideoState::Offline));
    CHECK(session.get("rc").get<std::int64_t>() == 0);
    CHECK(session.get("nm").is_null());
    CHECK(session.isOffline(keys));
}

TEST_CASE("video state labels") {
    CHECK(videoStateToString(VideoState::Online) == "online");
    CHECK(videoStateToString(VideoState::Offline) == "offline");
    CHECK(videoStateToString(VideoState::Private) == "private");
    CHECK(videoStateToString(static_cast<VideoState>(55)) == "unknown");
}

TEST_SUITE_END();
