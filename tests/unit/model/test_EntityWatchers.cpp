#include "ModelSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace MS;

namespace {

auto isOnline(Entity const& entity) -> bool {
    return entity.videoState() != toInteger(VideoState::Offline);
}

} // namespace

TEST_SUITE_BEGIN("model.watchers");

TEST_CASE("watchers fire once per edge") {
    EntityRegistry registry;
    auto&          entity  = registry.getOrCreate(60);
    int            onTrue  = 0;
    int            onFalse = 0;
    auto           handle  = entity.when(isOnline,
                                         [&](Entity&, Payload const&) { ++onTrue; },
                                         [&](Entity&, Payload const&) { ++onFalse; });
    CHECK(handle != 0);
    CHECK(entity.watcherCount() == 1);
    CHECK(onTrue == 0);

    REQUIRE(entity.merge(online(1)).has_value());
    CHECK(onTrue == 1);
    REQUIRE(entity.merge(online(1, "steady")).has_value());
    CHECK(onTrue == 1);
    CHECK(onFalse == 0);

    REQUIRE(entity.merge(offline(1)).has_value());
    CHECK(onTrue == 1);
    CHECK(onFalse == 1);

    REQUIRE(entity.merge(offline(1)).has_value());
    CHECK(onFalse == 1);
}

TEST_CASE("registration evaluates immediately") {
    EntityRegistry registry;
    auto&          entity = registry.getOrCreate(61);
    REQUIRE(entity.merge(online(2)).has_value());

    bool    fired = false;
    Payload received = "sentinel";
    entity.when(isOnline, [&](Entity& e, Payload const& payload) {
        fired    = true;
        received = payload;
        CHECK(e.id() == 61);
    });
    CHECK(fired);
    CHECK(received.is_null());
}

TEST_CASE("callbacks receive the triggering payload") {
    EntityRegistry registry;
    auto&          entity = registry.getOrCreate(62);
    Payload        received;
    entity.when(isOnline, [&](Entity&, Payload const& payload) { received = payload; });

    auto const payload = online(3, "Payloaded");
    REQUIRE(entity.merge(payload).has_value());
    CHECK(received == payload);
}

TEST_CASE("removed watchers stop firing") {
    EntityRegistry registry;
    auto&          entity = registry.getOrCreate(63);
    int            fired  = 0;
    auto           handle = entity.when(isOnline, [&](Entity&, Payload const&) { ++fired; });
    CHECK(entity.removeWatcher(handle));
    CHECK_FALSE(entity.removeWatcher(handle));
    CHECK(entity.watcherCount() == 0);
    REQUIRE(entity.merge(online(1)).has_value());
    CHECK(fired == 0);
}

TEST_CASE("callbacks may remove their own watcher") {
    EntityRegistry registry;
    auto&          entity = registry.getOrCreate(64);
    int            fired  = 0;
    WatcherHandle  handle = 0;
    handle                = entity.when(isOnline, [&](Entity& e, Payload const&) {
        ++fired;
        e.removeWatcher(handle);
    });
    REQUIRE(entity.merge(online(1)).has_value());
    REQUIRE(entity.merge(offline(1)).has_value());
    REQUIRE(entity.merge(online(2)).has_value());
    CHECK(fired == 1);
    CHECK(entity.watcherCount() == 0);
}

TEST_CASE("aggregate watchers latch per entity") {
    EntityRegistry        registry;
    auto&                 first  = registry.getOrCreate(70);
    auto&                 second = registry.getOrCreate(71);
    std::vector<EntityId> wentOnline;
    std::vector<EntityId> wentOffline;
    registry.aggregate().when(isOnline,
                              [&](Entity& e, Payload const&) { wentOnline.push_back(e.id()); },
                              [&](Entity& e, Payload const&) { wentOffline.push_back(e.id()); });

    REQUIRE(first.merge(online(1)).has_value());
    REQUIRE(second.merge(online(1)).has_value());
    REQUIRE(first.merge(online(1, "again")).has_value());
    CHECK((wentOnline == std::vector<EntityId>{70, 71}));

    REQUIRE(second.merge(offline(1)).has_value());
    CHECK((wentOffline == std::vector<EntityId>{71}));
}

TEST_CASE("aggregate registration sees entities already online") {
    EntityRegistry registry;
    REQUIRE(registry.getOrCreate(80).merge(online(1)).has_value());
    registry.getOrCreate(81);

    std::vector<EntityId> matched;
    registry.aggregate().when(isOnline, [&](Entity& e, Payload const&) { matched.push_back(e.id()); });
    CHECK((matched == std::vector<EntityId>{80}));
}

TEST_CASE("hidden merges do not evaluate watchers") {
    EntityRegistry registry;
    auto&          entity = registry.getOrCreate(90);
    REQUIRE(entity.merge(online(10)).has_value());
    int fired = 0;
    entity.when([](Entity const& e) { return e.session(5).has_value(); },
                [&](Entity&, Payload const&) { ++fired; });
    REQUIRE(entity.merge(online(5)).has_value());
    CHECK(fired == 0);
}

TEST_SUITE_END();
