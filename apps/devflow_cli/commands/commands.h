#pragma once

#include "devflow/app/workflow_service.h"
#include "devflow/core/result.h"

#include "../config.h"
#include <iosfwd>
#include <string>

namespace devflow::cli {

// Process exit codes.
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;     // usage or configuration error
inline constexpr int kExitRejected = 2;  // UnknownState / IllegalTransition
inline constexpr int kExitBackend = 3;   // tracker or claim registry failure

[[nodiscard]] int exit_code_for(const core::WorkflowError& error);

// CommandContext is what a tracker-backed subcommand runs with.
struct CommandContext {
  const CliConfig& config;        // NOLINT(readability-identifier-naming)
  app::WorkflowService& service;  // NOLINT(readability-identifier-naming)
  std::string backend_name;       // NOLINT(readability-identifier-naming)
  std::ostream& out;              // NOLINT(readability-identifier-naming)
  std::ostream& err;              // NOLINT(readability-identifier-naming)
};

// Prints a WorkflowError ("Error: ..." plus the alternatives) and returns its exit code.
int report_workflow_error(const CommandContext& ctx, const core::WorkflowError& error);

// ── Tracker-backed commands ──────────────────────────────────────
int cmd_list(const CommandContext& ctx);
int cmd_pickup(const CommandContext& ctx);
int cmd_show(const CommandContext& ctx);
int cmd_comment(const CommandContext& ctx);
int cmd_move(const CommandContext& ctx);
int cmd_complete(const CommandContext& ctx);
int cmd_report(const CommandContext& ctx);
int cmd_states(const CommandContext& ctx);

// ── Diagnostics ──────────────────────────────────────────────────

// doctor: checks the backend catalog and, when configured, Redis reachability.
int cmd_doctor(const CommandContext& ctx);

// redis-health: PING the configured Redis; no tracker involved.
int cmd_redis_health(const CliConfig& config, std::ostream& out, std::ostream& err);

int cmd_version(std::ostream& out);

}  // namespace devflow::cli
