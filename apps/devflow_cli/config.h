#pragma once

#include "devflow/core/env.h"

#include "shared/arg_parser.h"
#include <optional>
#include <string>
#include <vector>

namespace devflow::cli {

enum class BackendKind {
  kGitHub,   // NOLINT(readability-identifier-naming)
  kLinear,   // NOLINT(readability-identifier-naming)
  kFixture,  // NOLINT(readability-identifier-naming)
};

enum class OutputFormat {
  kTable,  // NOLINT(readability-identifier-naming)
  kJson,   // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string backend_kind_to_string(BackendKind kind);

// CliConfig holds every flag any subcommand accepts. Flags take precedence
// over environment variables; apply_env_defaults() fills what flags left unset.
struct CliConfig {
  std::string command;                   // NOLINT(readability-identifier-naming)
  std::optional<std::string> issue_id;   // NOLINT(readability-identifier-naming)

  // ── Backend ──────────────────────────────────────────────────────
  std::optional<BackendKind> backend;          // NOLINT(readability-identifier-naming)
  std::optional<std::string> repo;             // NOLINT(readability-identifier-naming)
  std::optional<int> project_number;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> team_key;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> fixture_path;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> scope;            // NOLINT(readability-identifier-naming)

  // ── Storage / coordination ───────────────────────────────────────
  std::optional<std::string> audit_db;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> worker_id;  // NOLINT(readability-identifier-naming)

  // ── Output ───────────────────────────────────────────────────────
  OutputFormat format{OutputFormat::kTable};  // NOLINT(readability-identifier-naming)
  bool show_audit{false};                     // NOLINT(readability-identifier-naming)
  bool help{false};                           // NOLINT(readability-identifier-naming)

  // ── Command-specific ─────────────────────────────────────────────
  std::optional<std::string> status;        // list --status
  int limit{50};                            // list --limit
  std::vector<std::string> states;          // pickup --state (repeatable)
  bool queue{false};                        // pickup --queue
  bool claim{false};                        // pickup --claim
  std::optional<std::string> to_state;      // move --to
  std::optional<std::string> body;          // comment --body
  std::optional<std::string> body_file;     // comment --file
  std::optional<std::string> summary;       // complete --summary
  std::optional<int> confidence;            // complete --confidence
  std::optional<std::string> test_results;  // complete --test-results
};

// Flag table shared by every subcommand.
[[nodiscard]] std::vector<apps::Option<CliConfig>> build_option_registry();

// Parses argv[2..] for the subcommand argv[1]. The first positional becomes
// issue_id; further positionals are errors.
[[nodiscard]] apps::ParsedOptions<CliConfig> parse_cli_args(int argc,
                                                            char* argv[]);  // NOLINT

// Environment fallbacks:
//   DEVFLOW_BACKEND, GITHUB_REPOSITORY, DEVFLOW_GITHUB_PROJECT, LINEAR_TEAM_KEY,
//   DEVFLOW_FIXTURE, DEVFLOW_AUDIT_DB, DEVFLOW_REDIS_URI, DEVFLOW_WORKER_ID.
// Returns error messages for environment values that do not parse.
[[nodiscard]] std::vector<std::string> apply_env_defaults(CliConfig& config,
                                                          const core::EnvLookup& env);

// The backend after flags and environment: github when nothing chose one.
[[nodiscard]] BackendKind effective_backend(const CliConfig& config);

}  // namespace devflow::cli
