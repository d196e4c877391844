#include <doctest/doctest.h>
#include "lorabroker/config.hpp"

#include <cstdlib>
#include <fstream>

#include <unistd.h>  // getpid

using namespace lorabroker;
namespace fs = std::filesystem;

TEST_CASE("Config fields override defaults, absent fields keep them") {
    BrokerConfig cfg;
    cfg.handler_fallback = "-";

    REQUIRE_FALSE(parse_config(R"({"registry_path":"/var/lib/lb/r.json","log_level":"debug"})", cfg));
    CHECK(cfg.registry_path == fs::path("/var/lib/lb/r.json"));
    CHECK(cfg.log_level == LogLevel::Debug);
    CHECK(cfg.handler_fallback == "-");
}

TEST_CASE("Unknown keys are ignored") {
    BrokerConfig cfg;
    CHECK_FALSE(parse_config(R"({"future_option":42})", cfg));
    CHECK(cfg.log_level == LogLevel::Info);
}

TEST_CASE("Malformed config is structural and changes nothing") {
    BrokerConfig cfg;
    cfg.handler_fallback = "/keep";

    CHECK(parse_config("{not json", cfg).is(ErrorKind::Structural));
    CHECK(parse_config("[1,2]", cfg).is(ErrorKind::Structural));
    CHECK(parse_config(R"({"log_level":"loud"})", cfg).is(ErrorKind::Structural));
    CHECK(parse_config(R"({"registry_path":5})", cfg).is(ErrorKind::Structural));
    CHECK(parse_config(R"({"handler_fallback":"/new","log_level":7})", cfg).is(ErrorKind::Structural));
    CHECK(cfg.handler_fallback == "/keep");
}

TEST_CASE("Missing config file leaves defaults") {
    BrokerConfig cfg;
    CHECK_FALSE(load_config("/nonexistent-dir-for-lorabroker/config.json", cfg));
    CHECK(cfg.registry_path.empty());
    CHECK(cfg.log_level == LogLevel::Info);
}

TEST_CASE("Config file is read from disk") {
    const fs::path file = fs::temp_directory_path()
                        / ("lorabroker-config-" + std::to_string(::getpid()) + ".json");
    std::ofstream(file) << R"({"log_level":"warn","handler_fallback":"/tmp/h"})";

    BrokerConfig cfg;
    CHECK_FALSE(load_config(file, cfg));
    CHECK(cfg.log_level == LogLevel::Warn);
    CHECK(cfg.handler_fallback == "/tmp/h");

    std::error_code ec;
    fs::remove(file, ec);
}

TEST_CASE("Default config path follows XDG_CONFIG_HOME") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old ? old : "";

    ::setenv("XDG_CONFIG_HOME", "/xdg/home", 1);
    CHECK(default_config_path() == fs::path("/xdg/home/lorabroker/config.json"));

    if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else     ::unsetenv("XDG_CONFIG_HOME");
}
