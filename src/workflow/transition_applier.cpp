#include "devflow/workflow/transition_applier.h"

#include <optional>
#include <utility>
#include <vector>

namespace devflow::workflow {

using ValidateResult = core::Result<domain::WorkflowState, core::WorkflowError>;
using ApplyResult = core::Result<TransitionReceipt, core::WorkflowError>;

TransitionApplier::TransitionApplier(tracker::IIssueTracker& tracker,
                                     const StateVocabulary& vocabulary)
    : tracker_(tracker), vocabulary_(vocabulary) {}

ValidateResult TransitionApplier::validate(const domain::Issue& issue,
                                           const std::string_view target) const {
  const auto to = vocabulary_.normalize(target);
  if (!to.has_value()) {
    const auto names = vocabulary_.canonical_names();
    return ValidateResult::err(core::WorkflowError{
        .kind = core::WorkflowErrorKind::kUnknownState,
        .message = "Unknown state '" + std::string(target) +
                   "'. Valid states: " + join_state_names(names),
        .requested = std::string(target),
        .from_state = issue.current_state,
        .to_state = "",
        .alternatives = names,
    });
  }

  const auto from = vocabulary_.normalize(issue.current_state);
  if (!from.has_value()) {
    // Without a recognised origin nothing can be proven legal; offer the whole catalog.
    const auto names = vocabulary_.canonical_names();
    const std::string shown_from =
        issue.current_state.empty() ? std::string("no status") : issue.current_state;
    return ValidateResult::err(core::WorkflowError{
        .kind = core::WorkflowErrorKind::kIllegalTransition,
        .message = "Cannot move " + issue.id.value + " from '" + shown_from + "' to '" +
                   to->canonical_name + "': current state is not a workflow state. Valid states: " +
                   join_state_names(names),
        .requested = std::string(target),
        .from_state = issue.current_state,
        .to_state = to->canonical_name,
        .alternatives = names,
    });
  }

  if (!vocabulary_.is_valid_transition(from.value(), to.value())) {
    const auto allowed = vocabulary_.allowed_targets(from.value());
    return ValidateResult::err(core::WorkflowError{
        .kind = core::WorkflowErrorKind::kIllegalTransition,
        .message = "Cannot move " + issue.id.value + " from '" + from->canonical_name + "' to '" +
                   to->canonical_name + "'. Allowed from '" + from->canonical_name +
                   "': " + join_state_names(allowed),
        .requested = std::string(target),
        .from_state = from->canonical_name,
        .to_state = to->canonical_name,
        .alternatives = allowed,
    });
  }

  return ValidateResult::ok(to.value());
}

ApplyResult TransitionApplier::apply(const domain::Issue& issue,
                                     const std::string_view target) const {
  auto validated = validate(issue, target);
  if (!validated.has_value()) {
    return ApplyResult::err(validated.error());
  }
  const domain::WorkflowState& to = validated.value();
  const auto from = vocabulary_.normalize(issue.current_state);

  auto backend_error = [&](std::string message) {
    return ApplyResult::err(core::WorkflowError{
        .kind = core::WorkflowErrorKind::kBackendError,
        .message = std::move(message),
        .requested = std::string(target),
        .from_state = from.has_value() ? from->canonical_name : issue.current_state,
        .to_state = to.canonical_name,
        .alternatives = {},
    });
  };

  auto native_states = tracker_.list_workflow_states();
  if (!native_states.has_value()) {
    return backend_error(native_states.error().message);
  }

  std::optional<domain::BackendState> native;
  std::vector<std::string> native_names;
  for (const auto& candidate : native_states.value()) {
    native_names.push_back(candidate.name);
    if (native.has_value()) {
      continue;
    }
    const auto normalized = vocabulary_.normalize(candidate.name);
    if (normalized.has_value() && normalized->order == to.order) {
      native = candidate;
    }
  }
  if (!native.has_value()) {
    return backend_error("State '" + to.canonical_name + "' is not configured on " +
                         tracker_.backend_name() + ". Available: " +
                         join_state_names(native_names));
  }

  auto written = tracker_.set_state(issue, native.value());
  if (!written.has_value()) {
    return backend_error(written.error().message);
  }

  return ApplyResult::ok(TransitionReceipt{
      .issue_id = issue.id,
      .from_state = from->canonical_name,
      .to_state = to.canonical_name,
      .native_state = native.value(),
  });
}

}  // namespace devflow::workflow
