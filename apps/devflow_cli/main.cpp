#include "devflow/app/workflow_service.h"
#include "devflow/coordination/claim_registry.h"
#include "devflow/coordination/redis_claim_registry.h"
#include "devflow/coordination/redis_endpoint.h"
#include "devflow/core/clock.h"
#include "devflow/core/env.h"
#include "devflow/core/id_generator.h"
#include "devflow/core/version.h"
#include "devflow/storage/audit_log.h"
#include "devflow/storage/sqlite/sqlite_audit_log.h"
#include "devflow/storage/sqlite/sqlite_db.h"

#include "backend_factory.h"
#include "commands/commands.h"
#include "config.h"
#include "output.h"
#include "startup_guard.h"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace devflow;

namespace {

void print_usage(std::ostream& out) {
  out << "Usage: devflow <command> [<id>] [options]\n\n"
         "Commands:\n"
         "  list                 Issues, optionally filtered by --status (--limit N)\n"
         "  pickup               Next issue to work on (--queue, --claim, --state)\n"
         "  show <id>            Issue details, description and comments\n"
         "  comment <id>         Post a comment (--body or --file)\n"
         "  move <id>            Move an issue to another state (--to)\n"
         "  complete <id>        Post a completion comment and move to review\n"
         "                       (--summary, --confidence, --test-results)\n"
         "  report               Status report grouped by state and priority\n"
         "  states               Workflow state catalog and backend mapping\n"
         "  doctor               Check backend states and Redis reachability\n"
         "  redis-health         PING the configured Redis\n"
         "  version              Print the version\n\n"
         "Options:\n"
      << apps::format_options_help(cli::build_option_registry());
}

// dispatch runs a tracker-backed subcommand.
int dispatch(const cli::CommandContext& ctx) {
  const std::string& command = ctx.config.command;
  if (command == "list") {
    return cli::cmd_list(ctx);
  }
  if (command == "pickup") {
    return cli::cmd_pickup(ctx);
  }
  if (command == "show") {
    return cli::cmd_show(ctx);
  }
  if (command == "comment") {
    return cli::cmd_comment(ctx);
  }
  if (command == "move") {
    return cli::cmd_move(ctx);
  }
  if (command == "complete") {
    return cli::cmd_complete(ctx);
  }
  if (command == "report") {
    return cli::cmd_report(ctx);
  }
  if (command == "states") {
    return cli::cmd_states(ctx);
  }
  if (command == "doctor") {
    return cli::cmd_doctor(ctx);
  }
  ctx.err << "Error: unknown command '" << command << "'\n";
  return cli::kExitUsage;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(std::cerr);
    return cli::kExitUsage;
  }
  const std::string first = argv[1];
  if (first == "--help" || first == "-h" || first == "help") {
    print_usage(std::cout);
    return cli::kExitOk;
  }
  if (first == "--version") {
    return cli::cmd_version(std::cout);
  }

  auto parsed = cli::parse_cli_args(argc, argv);
  cli::CliConfig& config = parsed.config;
  if (config.help) {
    print_usage(std::cout);
    return cli::kExitOk;
  }

  const core::EnvLookup env = core::process_env();
  for (const auto& message : cli::apply_env_defaults(config, env)) {
    parsed.errors.push_back(message);
  }
  if (!parsed.errors.empty()) {
    for (const auto& message : parsed.errors) {
      std::cerr << "Error: " << message << "\n";
    }
    return cli::kExitUsage;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = cli::validate_cli_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return cli::kExitUsage;
  }

  if (config.command == "version") {
    return cli::cmd_version(std::cout);
  }
  if (config.command == "redis-health") {
    return cli::cmd_redis_health(config, std::cout, std::cerr);
  }

  if (!config.worker_id.has_value()) {
    config.worker_id = "devflow-" + std::to_string(static_cast<long>(::getpid()));
  }

  auto backend = cli::open_backend(config, env);
  if (!backend.has_value()) {
    std::cerr << backend.error() << "\n";
    return cli::kExitUsage;
  }
  const auto& runtime = backend.value();

  const bool use_claims = config.command == "pickup" && config.claim && config.redis_uri.has_value();

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "devflow v" << core::kBuildVersion << "\n";
  std::cerr << "Backend:     " << runtime->description << "\n";
  if (config.audit_db.has_value()) {
    std::cerr << "Audit:       SQLite -- " << config.audit_db.value() << "\n";
  } else {
    std::cerr << "WARNING: No --audit-db path specified. Running with EPHEMERAL in-memory audit "
                 "log.\n"
                 "         This run's pickup and transition events will be LOST on exit.\n"
                 "         Pass --audit-db <path> or set DEVFLOW_AUDIT_DB to keep them.\n";
  }
  if (use_claims) {
    const auto endpoint = coordination::RedisEndpoint::parse(config.redis_uri.value());
    std::cerr << "Claims:      Redis -- "
              << (endpoint.has_value() ? endpoint->display() : config.redis_uri.value())
              << " (worker "
              << config.worker_id.value() << ")\n";
  } else if (config.claim) {
    std::cerr << "WARNING: --claim without --redis. The issue is moved to the work state but no\n"
                 "         claim is registered; concurrent workers may pick the same issue.\n";
  }
  // ─────────────────────────────────────────────────────────────────────────

  std::unique_ptr<storage::IAuditLog> audit_log;
  if (config.audit_db.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(config.audit_db.value());
    if (!db_result.has_value()) {
      std::cerr << "Error: " << db_result.error() << "\n";
      return cli::kExitUsage;
    }
    auto db = db_result.value();
    auto schema_result = db->migrate();
    if (!schema_result.has_value()) {
      std::cerr << "Error: failed to initialize audit schema: " << schema_result.error() << "\n";
      return cli::kExitUsage;
    }
    audit_log = std::make_unique<storage::sqlite::SqliteAuditLog>(db);
  } else {
    audit_log = std::make_unique<storage::InMemoryAuditLog>();
  }

  std::unique_ptr<coordination::IClaimRegistry> claims;
  if (use_claims) {
    try {
      claims = std::make_unique<coordination::RedisClaimRegistry>(config.redis_uri.value(),
                                                                  cli::claim_key_prefix(*runtime));
    } catch (const std::runtime_error& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return cli::kExitBackend;
    }
  }

  core::SequentialIdGenerator id_gen(core::process_run_stamp());
  core::SystemClock clock;

  app::Services services{*runtime->tracker, *audit_log, claims.get(),
                         id_gen, clock, runtime->pull_requests};
  app::WorkflowService service(services, *runtime->flavor);

  const cli::CommandContext ctx{config, service, runtime->tracker->backend_name(), std::cout,
                                std::cerr};
  const int code = dispatch(ctx);

  for (const auto& warning : service.warnings()) {
    std::cerr << "WARNING: " << warning << "\n";
  }
  if (config.show_audit) {
    std::cerr << "Audit trace " << service.trace_id() << ":\n"
              << cli::render_audit_trail(service.audit_trail());
  }
  return code;
}
