#pragma once

#include "devflow/domain/issue.h"
#include "devflow/workflow/priority_model.h"
#include "devflow/workflow/state_vocabulary.h"

#include <string>
#include <string_view>
#include <vector>

namespace devflow::workflow {

// WorkflowFlavor is everything that differs between the two backends.
// The engine itself is generic; it is parameterised only by one of these.
struct WorkflowFlavor {
  std::string name;        // "board" or "linear"
  std::string scope_kind;  // what a scope filter means: "milestone" or "project"
  std::string issue_ref_prefix;  // "#" on the board, so issue 42 reads "#42"
  StateTable states;
  PriorityTable priorities;
  std::vector<std::string> pickup_states;  // scanned in this order by pickup
  std::string work_state;                  // where a claimed issue is moved
  std::string review_state;                // where a completed issue is moved
  std::string review_footer;               // closing line of the completion comment, may be empty
};

// Kanban board flavor (GitHub Projects V2 "Status" column).
[[nodiscard]] const WorkflowFlavor& board_flavor();

// Linear workflow-state flavor.
[[nodiscard]] const WorkflowFlavor& linear_flavor();

// "board" (alias "github") or "linear"; nullptr for anything else.
[[nodiscard]] const WorkflowFlavor* find_flavor(std::string_view name);

// "issue/<id lower-cased>-<slug(title)>"; "issue/<id>" when the title slugs to nothing.
[[nodiscard]] std::string branch_name_for(const domain::Issue& issue);

}  // namespace devflow::workflow
