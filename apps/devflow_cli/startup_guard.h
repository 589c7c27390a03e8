#pragma once

#include "config.h"
#include <string>
#include <vector>

namespace devflow::cli {

// validate_cli_config checks startup preconditions for one devflow invocation.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - the subcommand is known
// - show/comment/move/complete name an issue id
// - move has --to; comment has --body or --file (not both); complete has
//   --summary and --confidence
// - --claim, redis-health: a Redis URI is configured and parses
// - --claim is not combined with --queue
// - fixture backend: --fixture is set
// - github backend: a repository slug owner/name is configured
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

// Known subcommands in help order.
[[nodiscard]] const std::vector<std::string>& known_commands();

}  // namespace devflow::cli
