#include "devflow/coordination/redis_endpoint.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdlib>
#include <string>

using devflow::coordination::RedisEndpoint;

TEST_CASE("RedisEndpoint::parse: accepted URIs", "[redis][endpoint]") {
  SECTION("tcp with port") {
    const auto endpoint = RedisEndpoint::parse("tcp://127.0.0.1:6380");
    REQUIRE(endpoint.has_value());
    CHECK(endpoint->host == "127.0.0.1");
    CHECK(endpoint->port == 6380);
    CHECK(endpoint->db == 0);
    CHECK(endpoint->uri == "tcp://127.0.0.1:6380");
  }

  SECTION("port defaults to 6379 on both schemes") {
    CHECK(RedisEndpoint::parse("tcp://cache.internal")->port == 6379);
    CHECK(RedisEndpoint::parse("redis://cache.internal")->port == 6379);
  }

  SECTION("redis scheme selects a database") {
    const auto endpoint = RedisEndpoint::parse("redis://localhost:6379/2");
    REQUIRE(endpoint.has_value());
    CHECK(endpoint->host == "localhost");
    CHECK(endpoint->db == 2);
  }
}

TEST_CASE("RedisEndpoint::parse: rejected URIs", "[redis][endpoint]") {
  SECTION("scheme") {
    CHECK_FALSE(RedisEndpoint::parse("").has_value());
    CHECK_FALSE(RedisEndpoint::parse("localhost:6379").has_value());
    CHECK_FALSE(RedisEndpoint::parse("http://localhost:6379").has_value());
  }

  SECTION("host and port") {
    CHECK_FALSE(RedisEndpoint::parse("tcp://").has_value());
    CHECK_FALSE(RedisEndpoint::parse("tcp://:6379").has_value());
    CHECK_FALSE(RedisEndpoint::parse("tcp://localhost:").has_value());
    CHECK_FALSE(RedisEndpoint::parse("tcp://localhost:abc").has_value());
    CHECK_FALSE(RedisEndpoint::parse("tcp://localhost:0").has_value());
    CHECK_FALSE(RedisEndpoint::parse("tcp://localhost:70000").has_value());
    CHECK_FALSE(RedisEndpoint::parse("tcp://localhost:-1").has_value());
  }

  SECTION("database index") {
    CHECK_FALSE(RedisEndpoint::parse("tcp://localhost:6379/1").has_value());
    CHECK_FALSE(RedisEndpoint::parse("redis://localhost:6379/").has_value());
    CHECK_FALSE(RedisEndpoint::parse("redis://localhost:6379/x").has_value());
  }
}

TEST_CASE("RedisEndpoint::display", "[redis][endpoint]") {
  CHECK(RedisEndpoint::parse("tcp://h:1")->display() == "h:1");
  CHECK(RedisEndpoint::parse("redis://h/3")->display() == "h:6379/3");
}

TEST_CASE("ping_redis reports an unreachable server", "[redis][endpoint]") {
  // Port 1 is reserved and never runs Redis.
  const auto endpoint = RedisEndpoint::parse("tcp://127.0.0.1:1");
  REQUIRE(endpoint.has_value());

  const auto ping = devflow::coordination::ping_redis(endpoint.value(),
                                                      std::chrono::milliseconds(200));
  CHECK_FALSE(ping.has_value());
  CHECK_FALSE(ping.error().empty());
}

TEST_CASE("ping_redis against a live server", "[redis][endpoint][integration]") {
  const char* enabled = std::getenv("DEVFLOW_TEST_REDIS");
  if (enabled == nullptr || std::string(enabled) != "1") {
    SKIP("set DEVFLOW_TEST_REDIS=1 to run against tcp://127.0.0.1:6379");
  }
  const auto ping = devflow::coordination::ping_redis(*RedisEndpoint::parse("tcp://127.0.0.1:6379"));
  CHECK(ping.has_value());
}
