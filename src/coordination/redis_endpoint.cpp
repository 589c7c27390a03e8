#include "devflow/coordination/redis_endpoint.h"

#include <sw/redis++/redis++.h>

#include <charconv>
#include <system_error>

namespace devflow::coordination {

namespace {

constexpr std::string_view kTcpScheme = "tcp://";
constexpr std::string_view kRedisScheme = "redis://";

// Digits only: from_chars alone would accept a leading '-'.
std::optional<int> parse_number(const std::string_view text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string_view::npos) {
    return std::nullopt;
  }
  int value = 0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RedisEndpoint> RedisEndpoint::parse(const std::string_view uri) {
  std::string_view rest;
  bool allows_db = false;
  if (uri.starts_with(kTcpScheme)) {
    rest = uri.substr(kTcpScheme.size());
  } else if (uri.starts_with(kRedisScheme)) {
    rest = uri.substr(kRedisScheme.size());
    allows_db = true;
  } else {
    return std::nullopt;
  }

  RedisEndpoint endpoint;
  endpoint.uri = std::string(uri);

  if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
    const auto db = allows_db ? parse_number(rest.substr(slash + 1)) : std::nullopt;
    if (!db.has_value()) {
      return std::nullopt;
    }
    endpoint.db = db.value();
    rest = rest.substr(0, slash);
  }

  // The last colon separates the port so "host" may itself contain none.
  if (const auto colon = rest.rfind(':'); colon != std::string_view::npos) {
    const auto port = parse_number(rest.substr(colon + 1));
    if (!port.has_value() || port.value() < 1 || port.value() > 65535) {
      return std::nullopt;
    }
    endpoint.port = port.value();
    rest = rest.substr(0, colon);
  }

  if (rest.empty()) {
    return std::nullopt;
  }
  endpoint.host = std::string(rest);
  return endpoint;
}

std::string RedisEndpoint::display() const {
  std::string text = host + ":" + std::to_string(port);
  if (db != 0) {
    text += "/" + std::to_string(db);
  }
  return text;
}

core::Result<bool, std::string> ping_redis(const RedisEndpoint& endpoint,
                                           const std::chrono::milliseconds timeout) {
  sw::redis::ConnectionOptions options;
  options.host = endpoint.host;
  options.port = endpoint.port;
  options.db = endpoint.db;
  options.connect_timeout = timeout;
  options.socket_timeout = timeout;

  try {
    sw::redis::Redis redis(options);
    redis.ping();
  } catch (const sw::redis::Error& e) {
    return core::Result<bool, std::string>::err(e.what());
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace devflow::coordination
