#include "commands.h"

#include "devflow/coordination/redis_endpoint.h"
#include "devflow/core/version.h"

#include <iostream>
#include <string>

namespace devflow::cli {

int cmd_doctor(const CommandContext& ctx) {
  bool healthy = true;

  ctx.out << "Backend: " << ctx.backend_name << " (" << ctx.service.flavor().name
          << " flavor)\n";

  const auto catalog = ctx.service.workflow_catalog();
  if (!catalog.has_value()) {
    ctx.out << "ERROR: backend unreachable: " << catalog.error().message << "\n";
    healthy = false;
  } else if (!catalog.value().check.valid) {
    ctx.out << "ERROR: workflow states missing on backend: "
            << workflow::join_state_names(catalog.value().check.missing) << "\n";
    healthy = false;
  } else {
    ctx.out << "OK: all " << catalog.value().check.found.size()
            << " workflow states configured\n";
  }
  if (catalog.has_value() && !catalog.value().check.extra.empty()) {
    ctx.out << "NOTE: backend states outside the workflow: "
            << workflow::join_state_names(catalog.value().check.extra) << "\n";
  }

  if (ctx.config.redis_uri.has_value()) {
    const auto endpoint = coordination::RedisEndpoint::parse(ctx.config.redis_uri.value());
    if (!endpoint.has_value()) {
      ctx.out << "ERROR: invalid Redis URI '" << ctx.config.redis_uri.value() << "'\n";
      healthy = false;
    } else if (const auto ping = coordination::ping_redis(endpoint.value()); ping.has_value()) {
      ctx.out << "OK: Redis reachable at " << endpoint->display() << "\n";
    } else {
      ctx.out << "ERROR: Redis: " << ping.error() << "\n";
      healthy = false;
    }
  } else {
    ctx.out << "NOTE: no claim registry configured (pickup --claim moves without a claim)\n";
  }

  return healthy ? kExitOk : kExitBackend;
}

int cmd_redis_health(const CliConfig& config, std::ostream& out, std::ostream& err) {
  // validate_cli_config has checked presence and format.
  const std::string uri = config.redis_uri.value_or("");
  const auto endpoint = coordination::RedisEndpoint::parse(uri);
  if (!endpoint.has_value()) {
    err << "Error: invalid Redis URI '" << uri << "'\n"
        << "Accepted formats: tcp://host[:port], redis://host[:port][/db]\n";
    return kExitUsage;
  }

  const auto ping = coordination::ping_redis(endpoint.value());
  if (ping.has_value()) {
    out << "OK: Redis reachable at " << endpoint->display() << "\n";
    return kExitOk;
  }

  err << "ERROR: " << ping.error() << "\n";
  return kExitBackend;
}

int cmd_version(std::ostream& out) {
  out << "devflow v" << core::kBuildVersion << "\n";
  return kExitOk;
}

}  // namespace devflow::cli
