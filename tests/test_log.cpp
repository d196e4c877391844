#include <doctest/doctest.h>
#include "lorabroker/log.hpp"

#include <sstream>
#include <thread>
#include <vector>

using namespace lorabroker;

TEST_CASE("Lines carry level label and tag") {
    std::ostringstream out;
    Logger log(out, LogLevel::Debug, "core");
    log.debug("a=1");
    log.warn("b=2");
    CHECK(out.str() == "[DEBUG] core: a=1\n[WARN ] core: b=2\n");
}

TEST_CASE("Level filter drops lower levels, off drops everything") {
    std::ostringstream out;
    Logger log(out, LogLevel::Warn);
    log.info("hidden");
    log.error("shown");
    CHECK(out.str() == "[ERROR] lorabroker: shown\n");

    log.set_level(LogLevel::Off);
    log.error("gone");
    CHECK(out.str() == "[ERROR] lorabroker: shown\n");
}

TEST_CASE("Child loggers share sink and level") {
    std::ostringstream out;
    Logger root(out, LogLevel::Info, "root");
    Logger child = root.with_tag("child");

    root.set_level(LogLevel::Error);
    child.info("filtered");
    child.error("x");
    CHECK(out.str() == "[ERROR] child: x\n");
}

TEST_CASE("Level names parse both ways") {
    LogLevel l = LogLevel::Info;
    for (const char* name : {"debug", "info", "warn", "error", "off"}) {
        REQUIRE(parse_log_level(name, l));
        CHECK(std::string(to_string(l)) == name);
    }
    CHECK_FALSE(parse_log_level("verbose", l));
    CHECK_FALSE(parse_log_level("INFO", l));
}

TEST_CASE("Concurrent writers never interleave inside a line") {
    std::ostringstream out;
    Logger log(out, LogLevel::Info, "t");
    std::vector<std::thread> ts;
    for (int i = 0; i < 4; ++i)
        ts.emplace_back([&log] { for (int j = 0; j < 100; ++j) log.info("0123456789"); });
    for (auto& t : ts) t.join();

    std::istringstream in(out.str());
    std::string line;
    int n = 0;
    while (std::getline(in, line)) {
        CHECK(line == "[INFO ] t: 0123456789");
        ++n;
    }
    CHECK(n == 400);
}

TEST_CASE("Level changes while child loggers write from other threads") {
    std::ostringstream out;
    Logger root(out, LogLevel::Info, "root");
    std::vector<std::thread> ts;
    for (int i = 0; i < 4; ++i) {
        Logger child = root.with_tag("w");
        ts.emplace_back([child] { for (int j = 0; j < 100; ++j) child.info("tick"); });
    }
    for (int j = 0; j < 100; ++j)
        root.set_level(j % 2 ? LogLevel::Info : LogLevel::Error);
    for (auto& t : ts) t.join();
    root.set_level(LogLevel::Warn);

    std::istringstream in(out.str());
    std::string line;
    int n = 0;
    while (std::getline(in, line)) {
        CHECK(line == "[INFO ] w: tick");
        ++n;
    }
    CHECK(n <= 400);
    CHECK(root.level() == LogLevel::Warn);
    CHECK(root.with_tag("x").level() == LogLevel::Warn);
}
