#include "devflow/workflow/flavor.h"

#include "devflow/core/normalization.h"

namespace devflow::workflow {

using domain::Ownership;

namespace {

WorkflowFlavor make_board_flavor() {
  WorkflowFlavor flavor;
  flavor.name = "board";
  flavor.scope_kind = "milestone";
  flavor.issue_ref_prefix = "#";

  flavor.states.states = {
      {"todo", Ownership::kHumanToAgent, "Approved for work; agents may pick it up"},
      {"planning", Ownership::kHuman, "Being scoped or broken down by a human"},
      {"dev ready", Ownership::kAgent, "Fully specified; next in line for an agent"},
      {"in progress", Ownership::kAgent, "An agent is implementing it"},
      {"review", Ownership::kHuman, "Implementation done; waiting for human review"},
      {"done", Ownership::kArchive, "Accepted and closed"},
  };
  flavor.states.aliases = {
      {"to do", "todo"},          {"to-do", "todo"},
      {"plan", "planning"},       {"planned", "planning"},
      {"ready", "dev ready"},     {"devready", "dev ready"},
      {"ready for dev", "dev ready"},
      {"inprogress", "in progress"}, {"wip", "in progress"},
      {"in review", "review"},    {"inreview", "review"},
      {"completed", "done"},      {"complete", "done"},
      {"closed", "done"},
  };
  flavor.states.backward_allowed = {
      {"review", "dev ready"},
      {"in progress", "dev ready"},
      {"dev ready", "planning"},
      {"dev ready", "todo"},
  };

  flavor.priorities.levels = {
      {"P: Critical", 0, {"P: Critical", "Critical"}, {}},
      {"P: HIGH", 1, {"P: HIGH", "High"}, {}},
      {"P: Medium", 2, {"P: Medium", "Medium"}, {}},
      {"P: low", 3, {"P: low", "Low"}, {}},
  };
  flavor.priorities.unranked = 4;

  flavor.pickup_states = {"todo", "dev ready"};
  flavor.work_state = "in progress";
  flavor.review_state = "review";
  return flavor;
}

WorkflowFlavor make_linear_flavor() {
  WorkflowFlavor flavor;
  flavor.name = "linear";
  flavor.scope_kind = "project";

  flavor.states.states = {
      {"Backlog", Ownership::kHuman, "Ideas and unrefined requests"},
      {"Todo", Ownership::kHumanToAgent, "Approved for work; agents may pick it up"},
      {"Dev Ready", Ownership::kAgent, "Fully specified; next in line for an agent"},
      {"In Progress", Ownership::kAgent, "An agent is implementing it"},
      {"In Review", Ownership::kHuman, "Implementation done; waiting for human review"},
      {"Done", Ownership::kArchive, "Accepted and closed"},
  };
  flavor.states.aliases = {
      {"backlog", "Backlog"},
      {"todo", "Todo"},           {"to do", "Todo"},          {"to-do", "Todo"},
      {"dev ready", "Dev Ready"}, {"devready", "Dev Ready"},  {"ready", "Dev Ready"},
      {"ready for dev", "Dev Ready"},
      {"in progress", "In Progress"}, {"inprogress", "In Progress"},
      {"in-progress", "In Progress"}, {"wip", "In Progress"},
      {"in review", "In Review"}, {"inreview", "In Review"},
      {"in-review", "In Review"}, {"review", "In Review"},
      {"done", "Done"},           {"completed", "Done"},
      {"complete", "Done"},       {"closed", "Done"},
  };
  flavor.states.backward_allowed = {
      {"In Review", "Dev Ready"},
      {"In Progress", "Dev Ready"},
      {"Dev Ready", "Todo"},
  };

  // Linear priority codes: 0 = none, 1 = urgent .. 4 = low.
  flavor.priorities.levels = {
      {"Urgent", 1, {}, {1}},
      {"High", 2, {}, {2}},
      {"Medium", 3, {}, {3}},
      {"Low", 4, {}, {4}},
      {"No priority", 5, {}, {0}},
  };
  flavor.priorities.unranked = 5;

  flavor.pickup_states = {"Todo", "Dev Ready"};
  flavor.work_state = "In Progress";
  flavor.review_state = "In Review";
  flavor.review_footer =
      "*Awaiting human review. Move to Done if acceptable, or back to Dev Ready with feedback.*";
  return flavor;
}

}  // namespace

const WorkflowFlavor& board_flavor() {
  static const WorkflowFlavor flavor = make_board_flavor();
  return flavor;
}

const WorkflowFlavor& linear_flavor() {
  static const WorkflowFlavor flavor = make_linear_flavor();
  return flavor;
}

const WorkflowFlavor* find_flavor(const std::string_view name) {
  const std::string key = core::normalize_ascii_lower(core::trim(name));
  if (key == "board" || key == "github") {
    return &board_flavor();
  }
  if (key == "linear") {
    return &linear_flavor();
  }
  return nullptr;
}

std::string branch_name_for(const domain::Issue& issue) {
  std::string branch = "issue/" + core::normalize_ascii_lower(issue.id.value);
  const std::string slug = core::slugify(issue.title);
  if (!slug.empty()) {
    branch += "-" + slug;
  }
  return branch;
}

}  // namespace devflow::workflow
