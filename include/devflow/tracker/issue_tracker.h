#pragma once

#include "devflow/core/ids.h"
#include "devflow/core/result.h"
#include "devflow/domain/issue.h"
#include "devflow/domain/workflow_state.h"

#include <optional>
#include <string>
#include <vector>

namespace devflow::tracker {

// IssueFilter narrows list_issues. An issue matches when its backend state
// name equals any entry of states, compared case- and separator-insensitively;
// an empty list matches every state. Callers that start from a canonical state
// pass every backend spelling of it (StateVocabulary::backend_names_for).
struct IssueFilter {
  std::vector<std::string> states;
  std::optional<std::string> scope;  // milestone or project name
  bool include_closed{false};        // report needs closed issues too
  int limit{0};                      // 0 reads every page
};

// IIssueTracker is the engine's only view of a backend.
// Every read returns a fresh copy; failures come back as BackendError values
// with the backend's message and never as exceptions.
class IIssueTracker {
 public:
  virtual ~IIssueTracker() = default;

  [[nodiscard]] virtual std::string backend_name() const = 0;

  [[nodiscard]] virtual core::Result<std::vector<domain::Issue>, core::BackendError> list_issues(
      const IssueFilter& filter) = 0;

  // Detail read: body and comments are populated.
  [[nodiscard]] virtual core::Result<domain::Issue, core::BackendError> get_issue(
      const core::IssueId& id) = 0;

  [[nodiscard]] virtual core::Result<bool, core::BackendError> post_comment(
      const domain::Issue& issue, const std::string& body) = 0;

  [[nodiscard]] virtual core::Result<bool, core::BackendError> set_state(
      const domain::Issue& issue, const domain::BackendState& target) = 0;

  // The backend's own state catalog, in backend order.
  [[nodiscard]] virtual core::Result<std::vector<domain::BackendState>, core::BackendError>
  list_workflow_states() = 0;

 protected:
  IIssueTracker() = default;
  IIssueTracker(const IIssueTracker&) = default;
  IIssueTracker& operator=(const IIssueTracker&) = default;
  IIssueTracker(IIssueTracker&&) = default;
  IIssueTracker& operator=(IIssueTracker&&) = default;
};

}  // namespace devflow::tracker
