#ifdef PT_LOG_DEBUG
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_and_thread") {
    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("hello log", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK(output.find("[TestTag]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_pool_and_inspector_tags") {
    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("pool chatter", std::source_location::current(), "WorkerPool");
        logger.log_impl("inspect chatter", std::source_location::current(), "Inspect");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("tags_keep_call_order") {
    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("ordered", std::source_location::current(), "Zeta", "Alpha");
        waitForFlush();
    });

    CHECK(output.find("[Zeta][Alpha]") != std::string::npos);
}

TEST_CASE("queued_messages_are_written_before_shutdown") {
    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        for (int i = 0; i < 50; ++i) {
            logger.log_impl("line " + std::to_string(i), std::source_location::current(), "Burst");
        }
    });

    CHECK(output.find("line 0") != std::string::npos);
    CHECK(output.find("line 49") != std::string::npos);
}

TEST_CASE("thread_name_is_used_in_output") {
    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Worker-7");
        logger.log_impl("with name", std::source_location::current(), "Test");
        waitForFlush();
    });

    CHECK(output.find("[Worker-7]") != std::string::npos);
}

TEST_CASE("global_wrappers_and_macro_emit_joined_tags") {
    auto output = captureStderr([] {
        PT::set_thread_name("WrapperThread");
        PT::set_logging_enabled(true);
        pt_log("via macro", "Alpha", "Beta");
        waitForFlush();
        PT::set_logging_enabled(false);
    });

    CHECK(output.find("Alpha][Beta") != std::string::npos);
    CHECK(output.find("[WrapperThread]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 123 "tests/unit/log/test_TaggedLogger.cpp"
        waitForFlush();
    });

    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE
#endif // PT_LOG_DEBUG
