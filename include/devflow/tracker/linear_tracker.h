#pragma once

#include "devflow/tracker/graphql_client.h"
#include "devflow/tracker/issue_tracker.h"
#include "devflow/tracker/linear_session.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace devflow::tracker {

// LinearTracker talks to the Linear GraphQL API for one team.
// Issues are identified by their team identifier ("ASA-42"); scope is a
// project name; workflow states are the team's states ordered by position.
class LinearTracker final : public IIssueTracker {
 public:
  LinearTracker(IHttpClient& http, LinearSession& session);

  [[nodiscard]] std::string backend_name() const override { return "linear"; }

  [[nodiscard]] core::Result<std::vector<domain::Issue>, core::BackendError> list_issues(
      const IssueFilter& filter) override;
  [[nodiscard]] core::Result<domain::Issue, core::BackendError> get_issue(
      const core::IssueId& id) override;
  [[nodiscard]] core::Result<bool, core::BackendError> post_comment(
      const domain::Issue& issue, const std::string& body) override;
  [[nodiscard]] core::Result<bool, core::BackendError> set_state(
      const domain::Issue& issue, const domain::BackendState& target) override;
  [[nodiscard]] core::Result<std::vector<domain::BackendState>, core::BackendError>
  list_workflow_states() override;

  // LINEAR_TEAM_KEY / --team when set, otherwise the first team. Cached in the session.
  [[nodiscard]] core::Result<LinearTeam, core::BackendError> team();

 private:
  LinearSession& session_;
  GraphQLClient graphql_;

  [[nodiscard]] core::Result<std::string, core::BackendError> node_id_for(const domain::Issue& issue);
};

}  // namespace devflow::tracker
