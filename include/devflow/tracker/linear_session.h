#pragma once

#include "devflow/core/env.h"
#include "devflow/core/result.h"
#include "devflow/domain/workflow_state.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devflow::tracker {

inline constexpr const char* kLinearGraphQLEndpoint = "https://api.linear.app/graphql";

enum class LinearAuthMethod {
  kOAuthToken,  // LINEAR_OAUTH_ACCESS_TOKEN
  kApiKey,      // LINEAR_API_KEY
};

[[nodiscard]] std::string_view linear_auth_method_to_string(LinearAuthMethod method);

struct LinearCredentials {
  LinearAuthMethod method{LinearAuthMethod::kApiKey};
  std::string token;

  // OAuth tokens go out as "Bearer <token>"; personal API keys are sent bare.
  [[nodiscard]] std::string authorization() const;
};

// Resolution order:
//   1. LINEAR_OAUTH_ACCESS_TOKEN
//   2. LINEAR_API_KEY
// LINEAR_OAUTH_CLIENT_ID/SECRET are recognised but never exchanged; when they
// are the only credentials configured the error says so.
[[nodiscard]] core::Result<LinearCredentials, std::string> resolve_linear_credentials(
    const core::EnvLookup& env);

struct LinearTeam {
  std::string id;
  std::string key;
  std::string name;
};

// LinearSession holds the credentials resolved at startup plus the team and
// workflow states once they have been fetched, so each is read at most once
// per process.
class LinearSession {
 public:
  LinearSession(LinearCredentials credentials, std::optional<std::string> team_key)
      : credentials_(std::move(credentials)), team_key_(std::move(team_key)) {}

  [[nodiscard]] const LinearCredentials& credentials() const { return credentials_; }
  [[nodiscard]] const std::optional<std::string>& team_key() const { return team_key_; }

  [[nodiscard]] const std::optional<LinearTeam>& team() const { return team_; }
  void cache_team(LinearTeam team) { team_ = std::move(team); }

  [[nodiscard]] const std::optional<std::vector<domain::BackendState>>& states() const {
    return states_;
  }
  void cache_states(std::vector<domain::BackendState> states) { states_ = std::move(states); }

 private:
  LinearCredentials credentials_;
  std::optional<std::string> team_key_;
  std::optional<LinearTeam> team_;
  std::optional<std::vector<domain::BackendState>> states_;
};

}  // namespace devflow::tracker
