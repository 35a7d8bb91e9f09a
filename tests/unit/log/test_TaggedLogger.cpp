#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#ifdef MS_LOG_DEBUG
#include <functional>
#include <iostream>
#include <sstream>
#include <string>

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([] {
        MS::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "Merge");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_thread_and_message") {
    auto output = captureStderr([] {
        MS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("merged session 4", std::source_location::current(), "Merge");
        logger.flush();
    });
    CHECK(output.find("[Merge]") != std::string::npos);
    CHECK(output.find("merged session 4") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
    CHECK(output.find("test_TaggedLogger.cpp") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_watcher_tag") {
    auto output = captureStderr([] {
        MS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("filtered", std::source_location::current(), "Watcher");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("enabled_tags_gate_output") {
    auto output = captureStderr([] {
        MS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setSkipTags({});
        logger.setEnabledTags({"Registry"});
        logger.setThreadName("Receiver");
        logger.log_impl("keep me", std::source_location::current(), "Registry");
        logger.log_impl("drop me", std::source_location::current(), "Registry", "Merge");
        logger.flush();
    });
    CHECK(output.find("keep me") != std::string::npos);
    CHECK(output.find("[Receiver]") != std::string::npos);
    CHECK(output.find("drop me") == std::string::npos);
}

}
#endif // MS_LOG_DEBUG
