#include "ModelSpaceTestHelper.hpp"

#include <modelspace/payload/Unquote.hpp>

#include <doctest/doctest.h>

using namespace MS;

TEST_SUITE_BEGIN("payload.unquote");

TEST_CASE("decodeComponent") {
    SUBCASE("plain text is untouched") {
        CHECK(decodeComponent("hello") == "hello");
        CHECK(decodeComponent("") == "");
    }
    SUBCASE("encoded text is decoded") {
        CHECK(decodeComponent("Hello%20World") == "Hello World");
        CHECK(decodeComponent("caf%C3%A9") == "caf\xC3\xA9");
        CHECK(decodeComponent("a%2Bb%3D%26") == "a+b=&");
    }
    SUBCASE("text that was never encoded stays as-is") {
        // Decodes, but the decoded form would re-encode the space.
        CHECK(decodeComponent("50% off%20now today") == "50% off%20now today");
        CHECK(decodeComponent("100%") == "100%");
        CHECK(decodeComponent("%zz") == "%zz");
    }
    SUBCASE("lowercase escapes do not round-trip") {
        CHECK(decodeComponent("a%2bb") == "a%2bb");
    }
    SUBCASE("invalid UTF-8 is not produced") {
        CHECK(decodeComponent("%FF%FE") == "%FF%FE");
        CHECK(decodeComponent("%C0%80") == "%C0%80");
        CHECK(decodeComponent("%ED%A0%80") == "%ED%A0%80");
        CHECK(decodeComponent("%F5%80%80%80") == "%F5%80%80%80");
        CHECK(decodeComponent("%E0%80%80") == "%E0%80%80");
        CHECK(decodeComponent("%F4%90%80%80") == "%F4%90%80%80");
    }
    SUBCASE("boundary code points still decode") {
        CHECK(decodeComponent("%ED%9F%BF") == "\xED\x9F\xBF");
        CHECK(decodeComponent("%F0%9F%98%80") == "\xF0\x9F\x98\x80");
        CHECK(decodeComponent("%F4%8F%BF%BF") == "\xF4\x8F\xBF\xBF");
    }
}

TEST_CASE("encodeComponent keeps the unreserved set") {
    CHECK(encodeComponent("a-b_c.d~e!f*g'h(i)j") == "a-b_c.d~e!f*g'h(i)j");
    CHECK(encodeComponent("a b/c") == "a%20b%2Fc");
}

TEST_CASE("decodePayloadStrings walks nested values") {
    nlohmann::json payload = {{"nm", "Jane%20Doe"},
                              {"m", {{"topic", "Hi%20%23fun"}, {"shout", "Hi%21"}, {"rank", 3}}},
                              {"tags", {"a%20b", "plain"}}};
    decodePayloadStrings(payload);
    CHECK(payload["nm"].get<std::string>() == "Jane Doe");
    CHECK(payload["m"]["topic"].get<std::string>() == "Hi #fun");
    CHECK(payload["m"]["shout"].get<std::string>() == "Hi%21");
    CHECK(payload["m"]["rank"].get<int>() == 3);
    CHECK(payload["tags"][0].get<std::string>() == "a b");
    CHECK(payload["tags"][1].get<std::string>() == "plain");
}

TEST_CASE("decoded payloads stay dumpable after a merge") {
    EntityRegistry registry;
    auto&          entity  = registry.getOrCreate(12);
    Payload        payload = online(3, "Odd%C0%80Name");
    payload["topic"]       = "caf%C3%A9%20%ED%A0%80";
    decodePayloadStrings(payload);
    CHECK(payload["name"].get<std::string>() == "Odd%C0%80Name");
    CHECK(payload["topic"].get<std::string>() == "caf%C3%A9%20%ED%A0%80");

    REQUIRE(entity.merge(payload).has_value());
    CHECK_NOTHROW((void)entity.describe());
    CHECK(entity.displayName().value_or("") == "Odd%C0%80Name");
}

TEST_SUITE_END();
