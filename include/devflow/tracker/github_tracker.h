#pragma once

#include "devflow/tracker/github_session.h"
#include "devflow/tracker/graphql_client.h"
#include "devflow/tracker/issue_tracker.h"
#include "devflow/tracker/pull_request_host.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace devflow::tracker {

// GitHubTracker reads repository issues and moves them between the columns of
// a Projects V2 board (the single-select "Status" field).
//
// - scope is a milestone title
// - an issue's state is its Status value on the session's project (or the
//   first project carrying a Status value when no project number is set)
// - workflow states are the Status options of the board
// - set_state adds the issue to the board first when it is on no board
// - pull requests target the repository's default branch
class GitHubTracker final : public IIssueTracker, public IPullRequestHost {
 public:
  GitHubTracker(IHttpClient& http, GitHubSession& session);

  [[nodiscard]] std::string backend_name() const override { return "github"; }

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

  [[nodiscard]] core::Result<PullRequest, core::BackendError> create_pull_request(
      const PullRequestDraft& draft) override;

  // The board, resolved once per session.
  [[nodiscard]] core::Result<ProjectBoard, core::BackendError> board();

 private:
  GitHubSession& session_;
  GraphQLClient graphql_;

  [[nodiscard]] domain::Issue parse_issue(const nlohmann::json& node) const;
};

}  // namespace devflow::tracker
