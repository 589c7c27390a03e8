#include "devflow/tracker/inmemory_issue_tracker.h"

#include "devflow/core/normalization.h"
#include "devflow/domain/issue_json.h"

#include <set>
#include <utility>

namespace devflow::tracker {

InMemoryIssueTracker::InMemoryIssueTracker(std::string backend_name)
    : backend_name_(std::move(backend_name)) {}

void InMemoryIssueTracker::load_fixture(const nlohmann::json& fixture) {
  if (fixture.contains("states")) {
    std::vector<domain::BackendState> states;
    for (const auto& state : fixture.at("states")) {
      states.push_back(domain::backend_state_from_json(state));
    }
    set_workflow_states(std::move(states));
  }
  if (fixture.contains("issues")) {
    for (const auto& issue : fixture.at("issues")) {
      upsert(domain::issue_from_json(issue));
    }
  }
}

void InMemoryIssueTracker::upsert(domain::Issue issue) {
  if (auto* existing = find(issue.id); existing != nullptr) {
    *existing = std::move(issue);
    return;
  }
  issues_.push_back(std::move(issue));
}

void InMemoryIssueTracker::set_workflow_states(std::vector<domain::BackendState> states) {
  states_ = std::move(states);
}

domain::Issue* InMemoryIssueTracker::find(const core::IssueId& id) {
  for (auto& issue : issues_) {
    if (issue.id == id) {
      return &issue;
    }
  }
  return nullptr;
}

core::Result<std::vector<domain::Issue>, core::BackendError> InMemoryIssueTracker::list_issues(
    const IssueFilter& filter) {
  using ListResult = core::Result<std::vector<domain::Issue>, core::BackendError>;
  ++list_calls_;
  if (failure_.has_value()) {
    return ListResult::err(core::BackendError{failure_.value()});
  }

  std::set<std::string> state_keys;
  for (const auto& state : filter.states) {
    state_keys.insert(core::fold_state_key(state));
  }

  std::vector<domain::Issue> out;
  for (const auto& issue : issues_) {
    if (!state_keys.empty() && !state_keys.contains(core::fold_state_key(issue.current_state))) {
      continue;
    }
    if (filter.scope.has_value() && issue.scope != filter.scope) {
      continue;
    }
    if (filter.limit > 0 && static_cast<int>(out.size()) >= filter.limit) {
      break;
    }
    // List reads are summaries; detail fields only come from get_issue.
    domain::Issue summary = issue;
    summary.body.clear();
    summary.comments.clear();
    out.push_back(std::move(summary));
  }
  return ListResult::ok(std::move(out));
}

core::Result<domain::Issue, core::BackendError> InMemoryIssueTracker::get_issue(
    const core::IssueId& id) {
  using GetResult = core::Result<domain::Issue, core::BackendError>;
  if (failure_.has_value()) {
    return GetResult::err(core::BackendError{failure_.value()});
  }
  const auto* issue = find(id);
  if (issue == nullptr) {
    return GetResult::err(core::BackendError{"Issue " + id.value + " not found"});
  }
  return GetResult::ok(*issue);
}

core::Result<bool, core::BackendError> InMemoryIssueTracker::post_comment(
    const domain::Issue& issue, const std::string& body) {
  using CommentResult = core::Result<bool, core::BackendError>;
  ++comment_calls_;
  if (failure_.has_value()) {
    return CommentResult::err(core::BackendError{failure_.value()});
  }
  auto* stored = find(issue.id);
  if (stored == nullptr) {
    return CommentResult::err(core::BackendError{"Issue " + issue.id.value + " not found"});
  }
  stored->comments.push_back(domain::IssueComment{backend_name_, body, ""});
  return CommentResult::ok(true);
}

core::Result<bool, core::BackendError> InMemoryIssueTracker::set_state(
    const domain::Issue& issue, const domain::BackendState& target) {
  using SetResult = core::Result<bool, core::BackendError>;
  ++set_state_calls_;
  if (failure_.has_value()) {
    return SetResult::err(core::BackendError{failure_.value()});
  }
  auto* stored = find(issue.id);
  if (stored == nullptr) {
    return SetResult::err(core::BackendError{"Issue " + issue.id.value + " not found"});
  }
  stored->current_state = target.name;
  return SetResult::ok(true);
}

core::Result<std::vector<domain::BackendState>, core::BackendError>
InMemoryIssueTracker::list_workflow_states() {
  using StatesResult = core::Result<std::vector<domain::BackendState>, core::BackendError>;
  if (failure_.has_value()) {
    return StatesResult::err(core::BackendError{failure_.value()});
  }
  return StatesResult::ok(states_);
}

}  // namespace devflow::tracker
