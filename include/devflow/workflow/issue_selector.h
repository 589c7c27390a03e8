#pragma once

#include "devflow/core/result.h"
#include "devflow/domain/issue.h"
#include "devflow/tracker/issue_tracker.h"
#include "devflow/workflow/priority_model.h"
#include "devflow/workflow/state_vocabulary.h"

#include <optional>
#include <string>
#include <vector>

namespace devflow::workflow {

// PickupCandidate is an issue tagged with the eligible state it was found in.
struct PickupCandidate {
  domain::Issue issue;
  std::string found_in_state;  // canonical name
  int rank{0};
};

// IssueSelector is the pickup engine: fetch per eligible state, merge, rank,
// pick the best. It only reads from the tracker.
//
// Scan order is the eligible-state list order. An issue seen in more than one
// scan (backend inconsistency) keeps the state of the first scan.
class IssueSelector {
 public:
  IssueSelector(tracker::IIssueTracker& tracker, const StateVocabulary& vocabulary,
                const PriorityModel& priorities);

  // Full ranked queue, best first.
  // kUnknownState if an eligible state does not normalize (no I/O is done);
  // kBackendError if any fetch fails.
  [[nodiscard]] core::Result<std::vector<PickupCandidate>, core::WorkflowError> rank_candidates(
      const std::vector<std::string>& eligible_states,
      const std::optional<std::string>& scope) const;

  // Head of rank_candidates; nullopt is "no eligible issue", not an error.
  [[nodiscard]] core::Result<std::optional<PickupCandidate>, core::WorkflowError> pickup(
      const std::vector<std::string>& eligible_states,
      const std::optional<std::string>& scope) const;

 private:
  tracker::IIssueTracker& tracker_;
  const StateVocabulary& vocabulary_;
  const PriorityModel& priorities_;
};

}  // namespace devflow::workflow
