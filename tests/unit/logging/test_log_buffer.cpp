#include <catch2/catch_test_macros.hpp>
#include "services/logger/LogManager.h"

#include <chrono>
#include <string>

using namespace fitz::logging;

namespace {
// The listener creates the logger at info; these cases want everything.
void use_trace_logger() {
    LogManager::init({ "FitzManTest", Level::trace });
    LogManager::reconfigure({ "FitzManTest", Level::trace });
}

bool contains(const std::vector<LogLine>& lines, const std::string& needle) {
    for (const auto& l : lines) {
        if (l.text.find(needle) != std::string::npos) return true;
    }
    return false;
}
}

TEST_CASE("log lines reach the in-memory buffer", "[logging]") {
    use_trace_logger();
    clear_log_buffer();
    LogManager::info("hello {}", 42);
    LogManager::warn("careful");
    auto lines = read_log_lines_snapshot(10);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].level == Level::info);
    REQUIRE(lines[0].text.find("hello 42") != std::string::npos);
    REQUIRE(lines[1].level == Level::warn);
}

TEST_CASE("the buffer keeps only the newest lines", "[logging]") {
    use_trace_logger();
    clear_log_buffer();
    set_log_buffer_capacity(3);
    for (int i = 0; i < 5; ++i) LogManager::info("line {}", i);
    auto lines = read_log_lines_snapshot(10);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines.front().text.find("line 2") != std::string::npos);
    REQUIRE(lines.back().text.find("line 4") != std::string::npos);
    REQUIRE(read_log_lines_snapshot(1).size() == 1);
}

TEST_CASE("a bad format string is logged instead of thrown", "[logging]") {
    use_trace_logger();
    clear_log_buffer();
    REQUIRE_NOTHROW(LogManager::info("unbalanced {", 1));
    auto lines = read_log_lines_snapshot(10);
    REQUIRE(contains(lines, "bad log format"));
}

TEST_CASE("level names parse", "[logging]") {
    REQUIRE(level_from_string("debug") == Level::debug);
    REQUIRE(level_from_string("warning") == Level::warn);
    REQUIRE(level_from_string("off") == Level::off);
    REQUIRE_FALSE(level_from_string("loud"));
    REQUIRE(std::string(level_to_label(Level::err)).size() > 0);
}

TEST_CASE("levels below the configured one are filtered", "[logging]") {
    use_trace_logger();
    LogManager::reconfigure({ "FitzManTest", Level::warn });
    clear_log_buffer();
    LogManager::info("quiet");
    LogManager::error("loud");
    auto lines = read_log_lines_snapshot(10);
    REQUIRE_FALSE(contains(lines, "quiet"));
    REQUIRE(contains(lines, "loud"));
    LogManager::reconfigure({ "FitzManTest", Level::trace });
}

TEST_CASE("buffered lines keep the bare message with its logger and time", "[logging]") {
    use_trace_logger();
    LogManager::reconfigure({ "FitzManTest", Level::trace, "[%H:%M:%S] [%l] %v" });
    const auto before = std::chrono::system_clock::now();
    LogManager::info("level {} cleared", 3);
    auto lines = read_log_lines_snapshot(1);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].text == "level 3 cleared");
    REQUIRE(lines[0].logger == "FitzManTest");
    REQUIRE(lines[0].time >= before - std::chrono::seconds(1));
}

TEST_CASE("level counts outlive dropped lines until cleared", "[logging]") {
    use_trace_logger();
    set_log_buffer_capacity(1);
    LogManager::warn("first");
    LogManager::warn("second");
    LogManager::error("third");
    LogManager::debug("fourth");

    REQUIRE(read_log_lines_snapshot(10).size() == 1);
    const LevelCounts counts = read_log_level_counts();
    REQUIRE(counts.warn == 2);
    REQUIRE(counts.err == 1);
    REQUIRE(counts.debug == 1);

    clear_log_buffer();
    REQUIRE(read_log_level_counts().warn == 0);
}

TEST_CASE("a zero capacity keeps counting without storing lines", "[logging]") {
    use_trace_logger();
    set_log_buffer_capacity(0);
    REQUIRE(log_buffer_capacity() == 0);
    LogManager::info("dropped");
    REQUIRE(read_log_lines_snapshot(10).empty());
    REQUIRE(read_log_level_counts().info == 1);
}
