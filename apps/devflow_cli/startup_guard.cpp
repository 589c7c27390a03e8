#include "startup_guard.h"

#include "devflow/coordination/redis_endpoint.h"
#include "devflow/tracker/github_session.h"

#include <algorithm>

namespace devflow::cli {

namespace {

bool needs_issue_id(const std::string& command) {
  return command == "show" || command == "comment" || command == "move" ||
         command == "complete";
}

// Commands that never talk to a tracker.
bool is_offline(const std::string& command) {
  return command == "version" || command == "redis-health";
}

std::string validate_redis_uri(const std::optional<std::string>& uri, const std::string& why) {
  if (!uri.has_value()) {
    return "Error: --redis <uri> is required " + why + ".\n"
           "       Pass --redis tcp://host:port or set DEVFLOW_REDIS_URI.";
  }
  if (!coordination::RedisEndpoint::parse(uri.value()).has_value()) {
    return "Error: --redis URI '" + uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host[:port], redis://host[:port][/db]";
  }
  return "";
}

}  // namespace

const std::vector<std::string>& known_commands() {
  static const std::vector<std::string> commands = {
      "list",   "pickup", "show",   "comment",      "move",    "complete",
      "report", "states", "doctor", "redis-health", "version",
  };
  return commands;
}

std::string validate_cli_config(const CliConfig& config) {
  const auto& commands = known_commands();
  if (std::find(commands.begin(), commands.end(), config.command) == commands.end()) {
    return "Error: unknown command '" + config.command + "'. Run devflow --help for usage.";
  }

  if (needs_issue_id(config.command) && !config.issue_id.has_value()) {
    return "Error: " + config.command + " requires an issue id (devflow " + config.command +
           " <id>)";
  }

  if (config.command == "move" && !config.to_state.has_value()) {
    return "Error: move requires --to <state>";
  }

  if (config.command == "comment") {
    if (!config.body.has_value() && !config.body_file.has_value()) {
      return "Error: comment requires --body <text> or --file <path>";
    }
    if (config.body.has_value() && config.body_file.has_value()) {
      return "Error: pass either --body or --file, not both";
    }
  }

  if (config.command == "complete") {
    if (!config.summary.has_value()) {
      return "Error: complete requires --summary <text>";
    }
    if (!config.confidence.has_value()) {
      return "Error: complete requires --confidence <0-100>";
    }
  }

  if (config.command == "redis-health") {
    return validate_redis_uri(config.redis_uri, "for redis-health");
  }

  if (config.command == "pickup" && config.claim) {
    if (config.queue) {
      return "Error: --claim and --queue cannot be combined";
    }
    if (config.redis_uri.has_value()) {
      const std::string redis_error = validate_redis_uri(config.redis_uri, "with --claim");
      if (!redis_error.empty()) {
        return redis_error;
      }
    }
  }

  if (is_offline(config.command)) {
    return "";
  }

  switch (effective_backend(config)) {
    case BackendKind::kFixture:
      if (!config.fixture_path.has_value()) {
        return "Error: --fixture <path> is required with --backend fixture";
      }
      break;
    case BackendKind::kGitHub:
      if (!config.repo.has_value()) {
        return "Error: --repo owner/name is required for the github backend.\n"
               "       Pass --repo or set GITHUB_REPOSITORY.";
      }
      if (!tracker::parse_repo_slug(config.repo.value()).has_value()) {
        return "Error: --repo '" + config.repo.value() + "' is not of the form owner/name";
      }
      break;
    case BackendKind::kLinear:
      break;
  }

  return "";
}

}  // namespace devflow::cli
