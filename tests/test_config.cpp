#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "pushwire/config.hpp"
#include "pushwire/notification_sink.hpp"
#include "fakes.hpp"

using namespace pushwire;
namespace fs = std::filesystem;

static fs::path write_config(const char* name, const std::string& text) {
    fs::path dir = fs::temp_directory_path() / "pushwire-tests" / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::ofstream(dir / "config.json") << text;
    return dir / "config.json";
}

TEST_CASE("Missing config file keeps the defaults") {
    Config cfg;
    Error err;
    CHECK(load_config(fs::temp_directory_path() / "pushwire-tests" / "nope" / "config.json", cfg, err));
    CHECK(cfg.keepalive_interval_ms == 30000u);
    CHECK(cfg.backoff_max_ms == 300000u);
}

TEST_CASE("Config file overrides only the keys it names") {
    const auto file = write_config("config-overlay",
        R"({ "api_url": "http://127.0.0.1:9000/1", "backoff_max_ms": 60000,
             "backoff_jitter": 0.1, "log_level": "debug", "device_name": "desk" })");
    Config cfg;
    Error err;
    REQUIRE(load_config(file, cfg, err));
    CHECK(cfg.api_url == "http://127.0.0.1:9000/1");
    CHECK(cfg.backoff_max_ms == 60000u);
    CHECK(cfg.backoff_jitter == doctest::Approx(0.1));
    CHECK(cfg.log_level == log::Level::Debug);
    CHECK(cfg.device_name == "desk");
    CHECK(cfg.push_url == "wss://client.pushover.net/push");
}

TEST_CASE("Bad values are rejected and leave the config untouched") {
    Error err;
    Config cfg;

    CHECK_FALSE(load_config(write_config("config-type", R"({ "keepalive_interval_ms": "soon" })"), cfg, err));
    CHECK(err.code == ErrorCode::StorageError);
    CHECK(err.reason.find("keepalive_interval_ms") != std::string::npos);

    CHECK_FALSE(load_config(write_config("config-jitter", R"({ "backoff_jitter": 1.5 })"), cfg, err));
    CHECK_FALSE(load_config(write_config("config-level", R"({ "log_level": "loud" })"), cfg, err));
    CHECK_FALSE(load_config(write_config("config-order", R"({ "backoff_min_ms": 9000, "backoff_max_ms": 10 })"), cfg, err));
    CHECK_FALSE(load_config(write_config("config-json", "{"), cfg, err));

    CHECK(cfg.backoff_min_ms == 1000u);
    CHECK(cfg.backoff_jitter == doctest::Approx(0.2));
}

TEST_CASE("Durations that would overflow when scaled are rejected") {
    Error err;
    Config cfg;

    CHECK_FALSE(load_config(write_config("config-retry", R"({ "emergency_retry_s": 5000000 })"), cfg, err));
    CHECK(err.reason == "bad_config_value: emergency_retry_s");

    err.clear();
    CHECK_FALSE(load_config(write_config("config-timeout", R"({ "network_timeout_ms": 3000000000 })"), cfg, err));
    CHECK(err.reason == "bad_config_value: network_timeout_ms");

    CHECK(load_config(write_config("config-retry-max", R"({ "emergency_retry_s": 4294967 })"), cfg, err));
    CHECK(cfg.emergency_retry_s == 4294967u);
    CHECK(cfg.network_timeout_ms == 15000u);
}

TEST_CASE("Console sink formats") {
    SinkFormat f = SinkFormat::Pretty;
    CHECK(parse_sink_format("json", f));
    CHECK(f == SinkFormat::Json);
    CHECK_FALSE(parse_sink_format("xml", f));
    CHECK(f == SinkFormat::Json);

    auto m = fakes::make_msg(9, Priority::High);

    std::ostringstream raw;
    ConsoleNotificationSink(raw, SinkFormat::Raw, false).display(*m);
    CHECK(raw.str() == "9\thigh\ttitle 9\tbody 9\n");

    std::ostringstream js;
    ConsoleNotificationSink(js, SinkFormat::Json, false).display(*m);
    auto j = nlohmann::json::parse(js.str());
    CHECK(j["id"] == 9);
    CHECK(j["priority_name"] == "high");

    std::ostringstream pretty;
    ConsoleNotificationSink(pretty, SinkFormat::Pretty, false).display(*fakes::make_msg(3, Priority::Emergency, "rc"));
    CHECK(pretty.str().find("[EMERGENCY] title 3") != std::string::npos);
    CHECK(pretty.str().find("ack rc") != std::string::npos);
    CHECK(pretty.str().find("\033[") == std::string::npos);
}
