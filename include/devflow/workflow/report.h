#pragma once

#include "devflow/domain/issue.h"
#include "devflow/workflow/priority_model.h"
#include "devflow/workflow/state_vocabulary.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace devflow::workflow {

struct StateGroup {
  std::string state;  // canonical name, raw backend name, or "no status"
  bool recognised{false};
  std::vector<domain::Issue> issues;
};

struct LabelGroup {
  std::string label;
  std::vector<core::IssueId> issue_ids;
};

struct PriorityCount {
  std::string level;
  int rank{0};
  std::size_t count{0};
};

struct StatusReport {
  std::optional<std::string> scope;
  std::size_t total{0};
  std::vector<StateGroup> by_state;         // canonical order, then unrecognised, then "no status"
  std::vector<LabelGroup> by_label;         // first-seen order
  std::vector<PriorityCount> by_priority;   // priority table order; empty levels omitted
};

inline constexpr const char* kNoStatus = "no status";

// Read-only aggregation over one snapshot of issues. Issues keep their input
// order inside every group.
[[nodiscard]] StatusReport build_status_report(const std::vector<domain::Issue>& issues,
                                               const StateVocabulary& vocabulary,
                                               const PriorityModel& priorities,
                                               const std::optional<std::string>& scope);

}  // namespace devflow::workflow
