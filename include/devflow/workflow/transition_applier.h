#pragma once

#include "devflow/core/ids.h"
#include "devflow/core/result.h"
#include "devflow/domain/issue.h"
#include "devflow/domain/workflow_state.h"
#include "devflow/tracker/issue_tracker.h"
#include "devflow/workflow/state_vocabulary.h"

#include <string>
#include <string_view>

namespace devflow::workflow {

struct TransitionReceipt {
  core::IssueId issue_id;
  std::string from_state;  // canonical
  std::string to_state;    // canonical
  domain::BackendState native_state;
};

// TransitionApplier validates a requested move and issues the single backend
// mutation. Validation is complete before any write, so a rejected move never
// touches the backend.
class TransitionApplier {
 public:
  TransitionApplier(tracker::IIssueTracker& tracker, const StateVocabulary& vocabulary);

  // Pure check: the canonical target on success, kUnknownState or
  // kIllegalTransition otherwise.
  [[nodiscard]] core::Result<domain::WorkflowState, core::WorkflowError> validate(
      const domain::Issue& issue, std::string_view target) const;

  // validate, resolve the target to a backend-native state, then exactly one set_state.
  [[nodiscard]] core::Result<TransitionReceipt, core::WorkflowError> apply(
      const domain::Issue& issue, std::string_view target) const;

 private:
  tracker::IIssueTracker& tracker_;
  const StateVocabulary& vocabulary_;
};

}  // namespace devflow::workflow
