#include "devflow/workflow/issue_selector.h"

#include <algorithm>
#include <set>
#include <utility>

namespace devflow::workflow {

using CandidatesResult = core::Result<std::vector<PickupCandidate>, core::WorkflowError>;

IssueSelector::IssueSelector(tracker::IIssueTracker& tracker, const StateVocabulary& vocabulary,
                             const PriorityModel& priorities)
    : tracker_(tracker), vocabulary_(vocabulary), priorities_(priorities) {}

CandidatesResult IssueSelector::rank_candidates(const std::vector<std::string>& eligible_states,
                                                const std::optional<std::string>& scope) const {
  // Resolve every requested state before touching the backend.
  std::vector<domain::WorkflowState> scan_order;
  for (const auto& raw : eligible_states) {
    const auto state = vocabulary_.normalize(raw);
    if (!state.has_value()) {
      const auto names = vocabulary_.canonical_names();
      return CandidatesResult::err(core::WorkflowError{
          .kind = core::WorkflowErrorKind::kUnknownState,
          .message = "Unknown state '" + raw + "'. Valid states: " + join_state_names(names),
          .requested = raw,
          .from_state = "",
          .to_state = "",
          .alternatives = names,
      });
    }
    const bool seen = std::any_of(scan_order.begin(), scan_order.end(),
                                  [&](const auto& s) { return s.order == state->order; });
    if (!seen) {
      scan_order.push_back(state.value());
    }
  }

  // Boards may name a column by any alias ("Ready", "WIP"), so each state is
  // fetched under every spelling the backend catalog uses for it.
  auto catalog = tracker_.list_workflow_states();
  if (!catalog.has_value()) {
    return CandidatesResult::err(core::WorkflowError{
        .kind = core::WorkflowErrorKind::kBackendError,
        .message = catalog.error().message,
        .requested = "",
        .from_state = "",
        .to_state = "",
        .alternatives = {},
    });
  }

  std::vector<PickupCandidate> candidates;
  std::set<core::IssueId> seen_ids;

  for (const auto& state : scan_order) {
    tracker::IssueFilter filter;
    filter.states = vocabulary_.backend_names_for(state, catalog.value());
    filter.scope = scope;

    auto fetched = tracker_.list_issues(filter);
    if (!fetched.has_value()) {
      return CandidatesResult::err(core::WorkflowError{
          .kind = core::WorkflowErrorKind::kBackendError,
          .message = fetched.error().message,
          .requested = state.canonical_name,
          .from_state = "",
          .to_state = "",
          .alternatives = {},
      });
    }

    for (const auto& issue : fetched.value()) {
      if (!seen_ids.insert(issue.id).second) {
        continue;
      }
      candidates.push_back(PickupCandidate{issue, state.canonical_name, priorities_.rank(issue)});
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [this](const PickupCandidate& a, const PickupCandidate& b) {
                     return priorities_.precedes(a.issue, b.issue);
                   });
  return CandidatesResult::ok(std::move(candidates));
}

core::Result<std::optional<PickupCandidate>, core::WorkflowError> IssueSelector::pickup(
    const std::vector<std::string>& eligible_states, const std::optional<std::string>& scope) const {
  using PickupResult = core::Result<std::optional<PickupCandidate>, core::WorkflowError>;

  auto ranked = rank_candidates(eligible_states, scope);
  if (!ranked.has_value()) {
    return PickupResult::err(ranked.error());
  }
  if (ranked.value().empty()) {
    return PickupResult::ok(std::nullopt);
  }
  return PickupResult::ok(ranked.value().front());
}

}  // namespace devflow::workflow
