#include "config.h"

#include <charconv>
#include <cstddef>
#include <string_view>
#include <system_error>
#include <utility>

namespace devflow::cli {

namespace {

std::optional<int> parse_int(const std::string_view text) {
  int value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<BackendKind> parse_backend(const std::string& value) {
  if (value == "github" || value == "board") {
    return BackendKind::kGitHub;
  }
  if (value == "linear") {
    return BackendKind::kLinear;
  }
  if (value == "fixture") {
    return BackendKind::kFixture;
  }
  return std::nullopt;
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_backend(CliConfig& config, const std::string& value) {
  config.backend = parse_backend(value);
  return config.backend.has_value();
}

bool handle_project_number(CliConfig& config, const std::string& value) {
  const auto number = parse_int(value);
  if (!number.has_value() || number.value() < 1) {
    return false;
  }
  config.project_number = number;
  return true;
}

bool handle_format(CliConfig& config, const std::string& value) {
  if (value == "table") {
    config.format = OutputFormat::kTable;
    return true;
  }
  if (value == "json") {
    config.format = OutputFormat::kJson;
    return true;
  }
  return false;
}

bool handle_confidence(CliConfig& config, const std::string& value) {
  const auto confidence = parse_int(value);
  if (!confidence.has_value() || confidence.value() < 0 || confidence.value() > 100) {
    return false;
  }
  config.confidence = confidence;
  return true;
}

bool handle_limit(CliConfig& config, const std::string& value) {
  const auto limit = parse_int(value);
  if (!limit.has_value() || limit.value() < 1) {
    return false;
  }
  config.limit = limit.value();
  return true;
}

// Setter for a plain optional<string> member.
template <std::optional<std::string> CliConfig::*Member>
bool set_string(CliConfig& config, const std::string& value) {
  if (value.empty()) {
    return false;
  }
  config.*Member = value;
  return true;
}

}  // namespace

std::string backend_kind_to_string(const BackendKind kind) {
  switch (kind) {
    case BackendKind::kGitHub:
      return "github";
    case BackendKind::kLinear:
      return "linear";
    case BackendKind::kFixture:
      return "fixture";
  }
  return "github";
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> build_option_registry() {
  return {
      {"--backend", true, "Issue tracker backend (github|linear|fixture)", handle_backend},
      {"--repo", true, "GitHub repository owner/name", set_string<&CliConfig::repo>},
      {"--project-number", true, "GitHub Projects V2 board number", handle_project_number},
      {"--team", true, "Linear team key", set_string<&CliConfig::team_key>},
      {"--fixture", true, "JSON fixture file for --backend fixture",
       set_string<&CliConfig::fixture_path>},
      {"--milestone", true, "Restrict to a milestone (github)", set_string<&CliConfig::scope>},
      {"--project", true, "Restrict to a project (linear)", set_string<&CliConfig::scope>},
      {"--audit-db", true, "SQLite file for the audit trail", set_string<&CliConfig::audit_db>},
      {"--redis", true, "Redis URI for pickup claims", set_string<&CliConfig::redis_uri>},
      {"--worker", true, "Worker id recorded on claims", set_string<&CliConfig::worker_id>},
      {"--format", true, "Output format (table|json)", handle_format},
      {"--show-audit", false, "Print this run's audit trail to stderr",
       [](CliConfig& c, const std::string&) {
         c.show_audit = true;
         return true;
       }},
      {"--help", false, "Show usage",
       [](CliConfig& c, const std::string&) {
         c.help = true;
         return true;
       }},
      {"--status", true, "list: only issues in this state", set_string<&CliConfig::status>},
      {"--limit", true, "list: maximum issues to print (default 50)", handle_limit},
      {"--state", true, "pickup: eligible state (repeatable)",
       [](CliConfig& c, const std::string& v) {
         if (v.empty()) {
           return false;
         }
         c.states.push_back(v);
         return true;
       }},
      {"--queue", false, "pickup: print the full ranked queue",
       [](CliConfig& c, const std::string&) {
         c.queue = true;
         return true;
       }},
      {"--claim", false, "pickup: claim the issue and move it to the work state",
       [](CliConfig& c, const std::string&) {
         c.claim = true;
         return true;
       }},
      {"--to", true, "move: target state", set_string<&CliConfig::to_state>},
      {"--body", true, "comment: comment text", set_string<&CliConfig::body>},
      {"--file", true, "comment: read the comment text from a file",
       set_string<&CliConfig::body_file>},
      {"--summary", true, "complete: implementation summary", set_string<&CliConfig::summary>},
      {"--confidence", true, "complete: confidence score 0-100", handle_confidence},
      {"--test-results", true, "complete: test output to include",
       set_string<&CliConfig::test_results>},
  };
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

apps::ParsedOptions<CliConfig> parse_cli_args(int argc, char* argv[]) {  // NOLINT
  CliConfig defaults;
  if (argc > 1) {
    defaults.command = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }

  const auto options = build_option_registry();
  auto parsed = apps::parse_options(argc, argv, options, 2, std::move(defaults));

  if (!parsed.positionals.empty()) {
    parsed.config.issue_id = parsed.positionals.front();
    for (std::size_t i = 1; i < parsed.positionals.size(); ++i) {
      parsed.errors.push_back("Unexpected argument: " + parsed.positionals[i]);
    }
  }
  return parsed;
}

std::vector<std::string> apply_env_defaults(CliConfig& config, const core::EnvLookup& env) {
  std::vector<std::string> errors;

  if (!config.backend.has_value()) {
    if (const auto value = env("DEVFLOW_BACKEND")) {
      config.backend = parse_backend(value.value());
      if (!config.backend.has_value()) {
        errors.push_back("DEVFLOW_BACKEND must be github, linear or fixture (got '" +
                         value.value() + "')");
      }
    }
  }

  if (!config.repo.has_value()) {
    config.repo = env("GITHUB_REPOSITORY");
  }

  if (!config.project_number.has_value()) {
    if (const auto value = env("DEVFLOW_GITHUB_PROJECT")) {
      config.project_number = parse_int(value.value());
      if (!config.project_number.has_value() || config.project_number.value() < 1) {
        config.project_number.reset();
        errors.push_back("DEVFLOW_GITHUB_PROJECT must be a positive number (got '" +
                         value.value() + "')");
      }
    }
  }

  if (!config.team_key.has_value()) {
    config.team_key = env("LINEAR_TEAM_KEY");
  }
  if (!config.fixture_path.has_value()) {
    config.fixture_path = env("DEVFLOW_FIXTURE");
  }
  if (!config.audit_db.has_value()) {
    config.audit_db = env("DEVFLOW_AUDIT_DB");
  }
  if (!config.redis_uri.has_value()) {
    config.redis_uri = env("DEVFLOW_REDIS_URI");
  }
  if (!config.worker_id.has_value()) {
    config.worker_id = env("DEVFLOW_WORKER_ID");
  }

  return errors;
}

BackendKind effective_backend(const CliConfig& config) {
  return config.backend.value_or(BackendKind::kGitHub);
}

}  // namespace devflow::cli
