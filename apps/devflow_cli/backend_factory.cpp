#include "backend_factory.h"

#include "devflow/tracker/github_tracker.h"
#include "devflow/tracker/inmemory_issue_tracker.h"
#include "devflow/tracker/linear_tracker.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace devflow::cli {

namespace {

using OpenResult = core::Result<std::shared_ptr<BackendRuntime>, std::string>;

OpenResult open_fixture(const CliConfig& config) {
  const std::string& path = config.fixture_path.value();
  std::ifstream in(path);
  if (!in) {
    return OpenResult::err("Error: cannot read fixture file '" + path + "'");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto runtime = std::make_shared<BackendRuntime>();
  auto fixture_tracker = std::make_unique<tracker::InMemoryIssueTracker>("fixture");
  try {
    const auto fixture = nlohmann::json::parse(buffer.str());
    const std::string flavor_name = fixture.value("flavor", std::string{"board"});
    runtime->flavor = workflow::find_flavor(flavor_name);
    if (runtime->flavor == nullptr) {
      return OpenResult::err("Error: fixture '" + path + "' names unknown flavor '" +
                             flavor_name + "' (valid: board, linear)");
    }
    fixture_tracker->load_fixture(fixture);
  } catch (const nlohmann::json::exception& e) {
    return OpenResult::err("Error: invalid fixture '" + path + "': " + e.what());
  }

  runtime->description = "fixture -- " + path + " (" + runtime->flavor->name + " flavor)";
  runtime->claim_namespace = "fixture:" + path;
  runtime->tracker = std::move(fixture_tracker);
  return OpenResult::ok(runtime);
}

OpenResult open_github(const CliConfig& config, const core::EnvLookup& env) {
  const auto token = tracker::resolve_github_token(env);
  if (!token.has_value()) {
    return OpenResult::err(
        "Error: GITHUB_TOKEN or GH_TOKEN is required for the github backend.");
  }
  // validate_cli_config has already checked the slug.
  const auto repo = tracker::parse_repo_slug(config.repo.value_or(""));
  if (!repo.has_value()) {
    return OpenResult::err("Error: --repo owner/name is required for the github backend.");
  }

  auto runtime = std::make_shared<BackendRuntime>();
  try {
    runtime->http = std::make_unique<tracker::CurlHttpClient>();
  } catch (const std::runtime_error& e) {
    return OpenResult::err(std::string("Error: ") + e.what());
  }
  runtime->github_session =
      std::make_unique<tracker::GitHubSession>(token.value(), repo.value(), config.project_number);
  auto github = std::make_unique<tracker::GitHubTracker>(*runtime->http, *runtime->github_session);
  runtime->pull_requests = github.get();
  runtime->tracker = std::move(github);
  runtime->flavor = &workflow::board_flavor();

  runtime->description = "GitHub -- " + repo->owner + "/" + repo->name;
  runtime->claim_namespace = "github:" + repo->owner + "/" + repo->name;
  if (config.project_number.has_value()) {
    runtime->description += " (project #" + std::to_string(config.project_number.value()) + ")";
  }
  return OpenResult::ok(runtime);
}

OpenResult open_linear(const CliConfig& config, const core::EnvLookup& env) {
  auto credentials = tracker::resolve_linear_credentials(env);
  if (!credentials.has_value()) {
    return OpenResult::err(credentials.error());
  }

  auto runtime = std::make_shared<BackendRuntime>();
  try {
    runtime->http = std::make_unique<tracker::CurlHttpClient>();
  } catch (const std::runtime_error& e) {
    return OpenResult::err(std::string("Error: ") + e.what());
  }
  runtime->linear_session =
      std::make_unique<tracker::LinearSession>(credentials.value(), config.team_key);
  runtime->tracker =
      std::make_unique<tracker::LinearTracker>(*runtime->http, *runtime->linear_session);
  runtime->flavor = &workflow::linear_flavor();

  runtime->description =
      "Linear -- team " + config.team_key.value_or("(first team)") + " via " +
      std::string(tracker::linear_auth_method_to_string(credentials.value().method));
  runtime->claim_namespace = "linear:" + config.team_key.value_or("default");
  return OpenResult::ok(runtime);
}

}  // namespace

std::string claim_key_prefix(const BackendRuntime& runtime) {
  return "devflow:claim:" + runtime.claim_namespace + ":";
}

core::Result<std::shared_ptr<BackendRuntime>, std::string> open_backend(
    const CliConfig& config, const core::EnvLookup& env) {
  switch (effective_backend(config)) {
    case BackendKind::kFixture:
      if (!config.fixture_path.has_value()) {
        return OpenResult::err("Error: --fixture <path> is required with --backend fixture");
      }
      return open_fixture(config);
    case BackendKind::kGitHub:
      return open_github(config, env);
    case BackendKind::kLinear:
      return open_linear(config, env);
  }
  return OpenResult::err("Error: unknown backend");
}

}  // namespace devflow::cli
