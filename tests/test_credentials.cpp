#include "devflow/tracker/github_session.h"
#include "devflow/tracker/linear_session.h"

#include <catch2/catch_test_macros.hpp>

using namespace devflow;

// ── Linear ──────────────────────────────────────────────────────────────────

TEST_CASE("resolve_linear_credentials: OAuth token wins over API key", "[credentials][linear]") {
  const auto result = tracker::resolve_linear_credentials(core::map_env(
      {{"LINEAR_OAUTH_ACCESS_TOKEN", "oauth-tok"}, {"LINEAR_API_KEY", "lin_api_123"}}));

  REQUIRE(result.has_value());
  CHECK(result.value().method == tracker::LinearAuthMethod::kOAuthToken);
  CHECK(result.value().authorization() == "Bearer oauth-tok");
  CHECK(tracker::linear_auth_method_to_string(result.value().method) == "oauth_token");
}

TEST_CASE("resolve_linear_credentials: API key is sent bare", "[credentials][linear]") {
  const auto result =
      tracker::resolve_linear_credentials(core::map_env({{"LINEAR_API_KEY", "lin_api_123"}}));

  REQUIRE(result.has_value());
  CHECK(result.value().method == tracker::LinearAuthMethod::kApiKey);
  CHECK(result.value().authorization() == "lin_api_123");
}

TEST_CASE("resolve_linear_credentials: client credentials alone are refused",
          "[credentials][linear]") {
  const auto result = tracker::resolve_linear_credentials(core::map_env(
      {{"LINEAR_OAUTH_CLIENT_ID", "id"}, {"LINEAR_OAUTH_CLIENT_SECRET", "secret"}}));

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("not supported") != std::string::npos);
}

TEST_CASE("resolve_linear_credentials: nothing configured", "[credentials][linear]") {
  const auto result = tracker::resolve_linear_credentials(core::map_env({}));

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("No Linear authentication") != std::string::npos);
  CHECK(result.error().find("LINEAR_API_KEY") != std::string::npos);
}

// ── GitHub ──────────────────────────────────────────────────────────────────

TEST_CASE("resolve_github_token: GITHUB_TOKEN then GH_TOKEN", "[credentials][github]") {
  CHECK(tracker::resolve_github_token(
            core::map_env({{"GITHUB_TOKEN", "a"}, {"GH_TOKEN", "b"}})) ==
        std::optional<std::string>{"a"});
  CHECK(tracker::resolve_github_token(core::map_env({{"GH_TOKEN", "b"}})) ==
        std::optional<std::string>{"b"});
  CHECK_FALSE(tracker::resolve_github_token(core::map_env({{"GITHUB_TOKEN", ""}})).has_value());
}

TEST_CASE("parse_repo_slug", "[credentials][github]") {
  const auto repo = tracker::parse_repo_slug("octo/widgets");
  REQUIRE(repo.has_value());
  CHECK(repo->owner == "octo");
  CHECK(repo->name == "widgets");

  CHECK_FALSE(tracker::parse_repo_slug("widgets").has_value());
  CHECK_FALSE(tracker::parse_repo_slug("/widgets").has_value());
  CHECK_FALSE(tracker::parse_repo_slug("octo/").has_value());
  CHECK_FALSE(tracker::parse_repo_slug("octo/widgets/extra").has_value());
}

TEST_CASE("GitHubSession sends the token as a bearer token", "[credentials][github]") {
  tracker::GitHubSession session("ghp_x", tracker::GitHubRepo{"octo", "widgets"}, 3);
  CHECK(session.authorization() == "Bearer ghp_x");
  CHECK(session.project_number() == std::optional<int>{3});
  CHECK_FALSE(session.board().has_value());
}
