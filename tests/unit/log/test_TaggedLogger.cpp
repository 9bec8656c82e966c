#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#ifdef JL_LOG_DEBUG

#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str()))
            original = std::string(existing);
        if (value)
            setenv(this->key.c_str(), value, 1);
        else
            unsetenv(this->key.c_str());
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original)
            setenv(key.c_str(), original->c_str(), 1);
        else
            unsetenv(key.c_str());
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

auto captureStderr(JL::TaggedLogger& logger, std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    logger.flush();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    JL::TaggedLogger logger;
    CHECK_FALSE(logger.isLoggingEnabled());
    auto output = captureStderr(logger, [&] { logger.log_impl("should not appear", std::source_location::current(), "TestTag"); });
    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_and_thread") {
    JL::TaggedLogger logger;
    logger.setLoggingEnabled(true);
    auto output = captureStderr(logger, [&] { logger.log_impl("hello log", std::source_location::current(), "Loader", "Warning"); });

    CHECK(output.find("[Loader][Warning]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("[Thread 0]") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    JL::TaggedLogger logger;
    logger.setLoggingEnabled(true);
    logger.setEnabledTags(" Memory , Search ");

    auto accepted = captureStderr(logger, [&] { logger.log_impl("keep me", std::source_location::current(), "Search"); });
    CHECK(accepted.find("keep me") != std::string::npos);

    auto rejected = captureStderr(logger, [&] { logger.log_impl("drop me", std::source_location::current(), "Loader"); });
    CHECK(rejected.empty());

    logger.setEnabledTags("");
    auto reopened = captureStderr(logger, [&] { logger.log_impl("back again", std::source_location::current(), "Loader"); });
    CHECK(reopened.find("back again") != std::string::npos);
}

TEST_CASE("thread_name_is_used_in_output") {
    JL::TaggedLogger logger;
    logger.setLoggingEnabled(true);
    logger.setThreadName("Worker-7");
    auto output = captureStderr(logger, [&] { logger.log_impl("with name", std::source_location::current(), "Test"); });
    CHECK(output.find("[Worker-7]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    JL::TaggedLogger logger;
    logger.setLoggingEnabled(true);
    auto output = captureStderr(logger, [&] {
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 102 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

TEST_CASE("environment_configures_global_logger") {
    {
        EnvGuard enable("JSONLENS_LOG", "1");
        EnvGuard tags("JSONLENS_LOG_TAGS", nullptr);
        JL::configure_logging_from_environment();
        CHECK(JL::logger().isLoggingEnabled());
    }
    {
        EnvGuard disable("JSONLENS_LOG", "off");
        JL::configure_logging_from_environment();
        CHECK_FALSE(JL::logger().isLoggingEnabled());
    }
    JL::set_logging_enabled(false);
}

} // TEST_SUITE

#endif // JL_LOG_DEBUG
