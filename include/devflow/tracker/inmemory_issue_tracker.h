#pragma once

#include "devflow/tracker/issue_tracker.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace devflow::tracker {

// InMemoryIssueTracker keeps issues in insertion order, the way a backend
// returns them. Used by tests and by `--backend fixture`.
// State filters match case- and separator-insensitively against the stored
// state names.
class InMemoryIssueTracker final : public IIssueTracker {
 public:
  explicit InMemoryIssueTracker(std::string backend_name = "fixture");

  // Fixture document:
  // {"flavor": "board", "states": [{"id": "...", "name": "..."}], "issues": [...]}
  // Issues use the devflow issue JSON shape. Throws nlohmann::json::exception
  // on malformed input.
  void load_fixture(const nlohmann::json& fixture);

  void upsert(domain::Issue issue);
  void set_workflow_states(std::vector<domain::BackendState> states);

  // While set, every call fails with this message.
  void set_failure(std::optional<std::string> message) { failure_ = std::move(message); }

  [[nodiscard]] std::size_t list_calls() const { return list_calls_; }
  [[nodiscard]] std::size_t set_state_calls() const { return set_state_calls_; }
  [[nodiscard]] std::size_t comment_calls() const { return comment_calls_; }

  [[nodiscard]] std::string backend_name() const override { return backend_name_; }

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

 private:
  std::string backend_name_;
  std::vector<domain::Issue> issues_;
  std::vector<domain::BackendState> states_;
  std::optional<std::string> failure_;
  std::size_t list_calls_{0};
  std::size_t set_state_calls_{0};
  std::size_t comment_calls_{0};

  [[nodiscard]] domain::Issue* find(const core::IssueId& id);
};

}  // namespace devflow::tracker
