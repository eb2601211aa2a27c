#include <catch2/catch_test_macros.hpp>

#include "wamlink/core/errors.hpp"
#include "wamlink/util/config_loader.hpp"

#include <chrono>
#include <string>

using wamlink::ConfigError;
using wamlink::util::parse_config;

TEST_CASE("Empty configuration yields the defaults", "[config]") {
    const auto config = parse_config("");
    REQUIRE(config.server.host == "0.0.0.0");
    REQUIRE(config.server.port == 8001);
    REQUIRE(config.server.path == "/ws");
    REQUIRE(config.default_device_port == 55001);
    REQUIRE(config.session.link.command_timeout == std::chrono::milliseconds(1000));
    REQUIRE(config.session.link.backoff.base == std::chrono::milliseconds(1000));
    REQUIRE(config.session.link.backoff.cap == std::chrono::milliseconds(30000));
    REQUIRE(config.session.link.backoff.max_attempts == 10);
    REQUIRE(config.session.broadcaster.keepalive_interval == std::chrono::seconds(30));
    REQUIRE(config.log.level == "info");
    REQUIRE(config.devices.empty());
}

TEST_CASE("Configuration overrides and device list are read", "[config]") {
    const auto config = parse_config(R"(
server:
  host: 127.0.0.1
  port: 9000
  path: /viewer
link:
  default_port: 56000
  command_timeout_ms: 2500
  max_consecutive_timeouts: 5
  reconnect:
    base_ms: 500
    cap_ms: 8000
    max_attempts: 4
broadcaster:
  queue_capacity: 16
  keepalive_interval_s: 10
  max_missed_keepalives: 2
log:
  level: debug
devices:
  - address: 192.168.0.10
  - id: kitchen
    address: 192.168.0.11
    port: 55002
    name: Kitchen
    auto_connect: true
)");

    REQUIRE(config.server.host == "127.0.0.1");
    REQUIRE(config.server.port == 9000);
    REQUIRE(config.server.path == "/viewer");
    REQUIRE(config.session.link.command_timeout == std::chrono::milliseconds(2500));
    REQUIRE(config.session.link.max_consecutive_timeouts == 5);
    REQUIRE(config.session.link.backoff.max_attempts == 4);
    REQUIRE(config.session.broadcaster.queue_capacity == 16);
    REQUIRE(config.session.broadcaster.max_missed_keepalives == 2);
    REQUIRE(config.log.level == "debug");

    REQUIRE(config.devices.size() == 2);
    REQUIRE(config.devices[0].descriptor.id == "192.168.0.10");
    REQUIRE(config.devices[0].descriptor.port == 56000);
    REQUIRE_FALSE(config.devices[0].auto_connect);
    REQUIRE(config.devices[1].descriptor.id == "kitchen");
    REQUIRE(config.devices[1].descriptor.port == 55002);
    REQUIRE(config.devices[1].descriptor.name == std::string("Kitchen"));
    REQUIRE(config.devices[1].auto_connect);

    REQUIRE(wamlink::util::descriptors_of(config).size() == 2);
}

TEST_CASE("Invalid configuration values are rejected", "[config]") {
    REQUIRE_THROWS_AS(parse_config("server:\n  port: 70000\n"), ConfigError);
    REQUIRE_THROWS_AS(parse_config("server:\n  path: ws\n"), ConfigError);
    REQUIRE_THROWS_AS(parse_config("link:\n  reconnect:\n    base_ms: 5000\n    cap_ms: 1000\n"), ConfigError);
    REQUIRE_THROWS_AS(parse_config("broadcaster:\n  queue_capacity: 0\n"), ConfigError);
    REQUIRE_THROWS_AS(parse_config("link:\n  command_timeout_ms: soon\n"), ConfigError);
    REQUIRE_THROWS_AS(parse_config("devices:\n  - name: missing-address\n"), ConfigError);
    REQUIRE_THROWS_AS(parse_config("- just\n- a list\n"), ConfigError);
    REQUIRE_THROWS_AS(parse_config("server: [unclosed\n"), ConfigError);
    REQUIRE_THROWS_AS(wamlink::util::load_config("/nonexistent/wamlink.yaml"), ConfigError);
}
