#pragma once

#include "devflow/core/result.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace devflow::coordination {

inline constexpr int kDefaultRedisPort = 6379;

// Where the claim registry lives. Parsed from
//   tcp://host[:port]
//   redis://host[:port][/db]
// A database index is only meaningful with the redis:// scheme.
struct RedisEndpoint {
  std::string uri;                // NOLINT(readability-identifier-naming)
  std::string host;               // NOLINT(readability-identifier-naming)
  int port{kDefaultRedisPort};    // NOLINT(readability-identifier-naming)
  int db{0};                      // NOLINT(readability-identifier-naming)

  [[nodiscard]] static std::optional<RedisEndpoint> parse(std::string_view uri);

  // "host:port", plus "/db" when a database other than 0 is selected.
  [[nodiscard]] std::string display() const;
};

// Opens a short-lived connection and sends PING. Never registers a claim.
// The error string carries the redis++ message.
[[nodiscard]] core::Result<bool, std::string> ping_redis(
    const RedisEndpoint& endpoint,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

}  // namespace devflow::coordination
