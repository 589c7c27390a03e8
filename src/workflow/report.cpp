#include "devflow/workflow/report.h"

#include <map>
#include <utility>

namespace devflow::workflow {

StatusReport build_status_report(const std::vector<domain::Issue>& issues,
                                 const StateVocabulary& vocabulary,
                                 const PriorityModel& priorities,
                                 const std::optional<std::string>& scope) {
  StatusReport report;
  report.scope = scope;
  report.total = issues.size();

  const auto& states = vocabulary.states();
  std::vector<std::vector<domain::Issue>> canonical_groups(states.size());
  std::vector<StateGroup> unrecognised;
  std::vector<domain::Issue> no_status;

  std::map<std::string, std::size_t> label_index;
  std::map<int, std::size_t> rank_counts;

  for (const auto& issue : issues) {
    if (issue.current_state.empty()) {
      no_status.push_back(issue);
    } else if (const auto state = vocabulary.normalize(issue.current_state); state.has_value()) {
      canonical_groups[state->order].push_back(issue);
    } else {
      bool placed = false;
      for (auto& group : unrecognised) {
        if (group.state == issue.current_state) {
          group.issues.push_back(issue);
          placed = true;
          break;
        }
      }
      if (!placed) {
        unrecognised.push_back(StateGroup{issue.current_state, false, {issue}});
      }
    }

    for (const auto& label : issue.labels) {
      const auto [it, inserted] = label_index.emplace(label, report.by_label.size());
      if (inserted) {
        report.by_label.push_back(LabelGroup{label, {}});
      }
      report.by_label[it->second].issue_ids.push_back(issue.id);
    }

    ++rank_counts[priorities.rank(issue)];
  }

  for (const auto& state : states) {
    auto& group = canonical_groups[state.order];
    if (!group.empty()) {
      report.by_state.push_back(StateGroup{state.canonical_name, true, std::move(group)});
    }
  }
  for (auto& group : unrecognised) {
    report.by_state.push_back(std::move(group));
  }
  if (!no_status.empty()) {
    report.by_state.push_back(StateGroup{kNoStatus, false, std::move(no_status)});
  }

  // One bucket per rank, named after the first level carrying it.
  for (const auto& level : priorities.levels()) {
    const auto it = rank_counts.find(level.rank);
    if (it != rank_counts.end()) {
      report.by_priority.push_back(PriorityCount{level.name, level.rank, it->second});
      rank_counts.erase(it);
    }
  }
  if (const auto it = rank_counts.find(priorities.unranked()); it != rank_counts.end()) {
    report.by_priority.push_back(
        PriorityCount{priorities.unranked_name(), priorities.unranked(), it->second});
  }

  return report;
}

}  // namespace devflow::workflow
