#include "output.h"

#include "devflow/domain/issue_json.h"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace devflow::cli {

namespace {

constexpr std::size_t kReportGroupPreview = 5;

bool is_board(const workflow::WorkflowFlavor& flavor) { return flavor.name == "board"; }

std::string issue_ref(const workflow::WorkflowFlavor& flavor, const domain::Issue& issue) {
  return flavor.issue_ref_prefix + issue.id.value;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

// Board issues show their labels; linear issues show their priority label.
std::string tag_suffix(const workflow::WorkflowFlavor& flavor, const domain::Issue& issue) {
  if (is_board(flavor)) {
    return issue.labels.empty() ? "" : " [" + join(issue.labels, ", ") + "]";
  }
  return issue.priority_label.empty() ? "" : " [" + issue.priority_label + "]";
}

std::string state_or_no_status(const std::string& state) {
  return state.empty() ? std::string(workflow::kNoStatus) : state;
}

}  // namespace

std::string title_case(const std::string& text) {
  std::string out = text;
  bool at_word_start = true;
  for (auto& c : out) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc) != 0) {
      c = static_cast<char>(at_word_start ? std::toupper(uc) : std::tolower(uc));
      at_word_start = false;
    } else {
      at_word_start = true;
    }
  }
  return out;
}

// ────────────────────────────────────────────────────────────────
// Table output
// ────────────────────────────────────────────────────────────────

std::string format_issue_line(const workflow::WorkflowFlavor& flavor,
                              const domain::Issue& issue) {
  return issue_ref(flavor, issue) + ": " + issue.title + tag_suffix(flavor, issue) + " (" +
         state_or_no_status(issue.current_state) + ")";
}

std::string render_issue_list(const workflow::WorkflowFlavor& flavor,
                              const std::vector<domain::Issue>& issues) {
  if (issues.empty()) {
    return "No issues found\n";
  }
  std::string out;
  for (const auto& issue : issues) {
    out += format_issue_line(flavor, issue) + "\n";
  }
  return out;
}

std::string render_pickup(const workflow::WorkflowFlavor& flavor,
                          const workflow::PickupCandidate& candidate,
                          const workflow::PriorityModel& priorities) {
  const auto& issue = candidate.issue;
  std::string out = "Next issue to work on:\n";
  out += "  " + issue_ref(flavor, issue) + ": " + issue.title;
  if (is_board(flavor)) {
    out += tag_suffix(flavor, issue) + "\n";
    out += "  Column: " + candidate.found_in_state + "\n";
  } else {
    out += "\n";
    out += "  State: " + candidate.found_in_state + "\n";
    out += "  Priority: " +
           (issue.priority_label.empty() ? priorities.level_name(candidate.rank)
                                         : issue.priority_label) +
           "\n";
  }
  out += "  Branch: " + workflow::branch_name_for(issue) + "\n";
  if (!is_board(flavor) && !issue.url.empty()) {
    out += "  URL: " + issue.url + "\n";
  }
  return out;
}

std::string render_queue(const workflow::WorkflowFlavor& flavor,
                         const std::vector<workflow::PickupCandidate>& queue,
                         const workflow::PriorityModel& priorities) {
  if (queue.empty()) {
    return "No issues ready for pickup\n";
  }
  std::string out = "Pickup queue (" + std::to_string(queue.size()) + "):\n";
  std::size_t position = 1;
  for (const auto& candidate : queue) {
    out += "  " + std::to_string(position++) + ". " + issue_ref(flavor, candidate.issue) + ": " +
           candidate.issue.title + " [" + priorities.level_name(candidate.rank) + "] (" +
           candidate.found_in_state + ")\n";
  }
  return out;
}

std::string render_issue_detail(const workflow::WorkflowFlavor& flavor,
                                const domain::Issue& issue) {
  std::string out = "Issue " + issue_ref(flavor, issue) + ": " + issue.title + "\n";
  if (!issue.url.empty()) {
    out += "URL: " + issue.url + "\n";
  }
  out += "State: " + state_or_no_status(issue.current_state) + "\n";
  if (!issue.priority_label.empty()) {
    out += "Priority: " + issue.priority_label + "\n";
  }
  if (!issue.labels.empty()) {
    out += "Labels: " + join(issue.labels, ", ") + "\n";
  }
  if (issue.scope.has_value()) {
    out += title_case(flavor.scope_kind) + ": " + issue.scope.value() + "\n";
  }
  if (issue.assignee.has_value()) {
    out += "Assignee: " + issue.assignee.value() + "\n";
  }
  out += "Branch: " + workflow::branch_name_for(issue) + "\n";

  out += "\n--- Description ---\n";
  out += (issue.body.empty() ? "(no description)" : issue.body) + "\n";

  if (!issue.comments.empty()) {
    out += "\n--- Comments (" + std::to_string(issue.comments.size()) + ") ---\n";
    std::size_t index = 1;
    for (const auto& comment : issue.comments) {
      out += "\n[" + std::to_string(index++) + "] " +
             (comment.author.empty() ? "unknown" : comment.author);
      if (!comment.created_at.empty()) {
        out += " (" + comment.created_at + ")";
      }
      out += ":\n" + comment.body + "\n";
    }
  }
  return out;
}

std::string render_report(const workflow::WorkflowFlavor& flavor,
                          const workflow::StatusReport& report) {
  std::string out = "## Status Report: " + report.scope.value_or("All Issues") + "\n\n";
  out += "**Total Issues:** " + std::to_string(report.total) + "\n\n";

  out += "### By Status\n";
  for (const auto& group : report.by_state) {
    out += "\n**" + title_case(group.state) + "** (" + std::to_string(group.issues.size()) +
           ")\n";
    const std::size_t shown = std::min(group.issues.size(), kReportGroupPreview);
    for (std::size_t i = 0; i < shown; ++i) {
      const auto& issue = group.issues[i];
      out += "  - " + issue_ref(flavor, issue) + ": " + issue.title + tag_suffix(flavor, issue) +
             "\n";
    }
    if (group.issues.size() > kReportGroupPreview) {
      out += "  ... and " + std::to_string(group.issues.size() - kReportGroupPreview) + " more\n";
    }
  }

  out += "\n### By Priority\n";
  for (const auto& level : report.by_priority) {
    out += "- **" + level.level + "**: " + std::to_string(level.count) + " issues\n";
  }
  return out;
}

std::string render_catalog(const workflow::WorkflowFlavor& flavor,
                           const app::WorkflowCatalog& catalog, const std::string& backend_name) {
  std::string out = "Workflow States (" + flavor.name + " flavor)\n";
  out += std::string(50, '=') + "\n";

  for (const auto& state : catalog.canonical) {
    out += "\n[" + state.canonical_name + "]\n";
    out += "  Owner: " + std::string(domain::ownership_to_string(state.ownership)) + "\n";
    if (!state.description.empty()) {
      out += "  " + state.description + "\n";
    }
  }

  out += "\nAgent Pickup States: " + join(flavor.pickup_states, ", ") + "\n";
  out += "Agent Work State: " + flavor.work_state + "\n";
  out += "Review State: " + flavor.review_state + "\n";

  out += "\nBackend states (" + backend_name + "):\n";
  for (const auto& state : catalog.backend) {
    out += "  - " + state.name;
    if (!state.id.empty()) {
      out += " (" + state.id + ")";
    }
    out += "\n";
  }

  if (catalog.check.valid) {
    out += "\nCatalog: OK, every canonical state is configured\n";
  } else {
    out += "\nCatalog: MISSING " + join(catalog.check.missing, ", ") + "\n";
  }
  if (!catalog.check.extra.empty()) {
    out += "Unmapped backend states: " + join(catalog.check.extra, ", ") + "\n";
  }
  return out;
}

std::string render_audit_trail(const std::vector<storage::AuditEvent>& events) {
  std::string out;
  for (const auto& event : events) {
    out += "[audit] " + event.created_at + " " + event.event_type + " " + event.payload + "\n";
  }
  return out;
}

// ────────────────────────────────────────────────────────────────
// JSON output
// ────────────────────────────────────────────────────────────────

nlohmann::json candidate_to_json(const workflow::PickupCandidate& candidate,
                                 const workflow::PriorityModel& priorities) {
  nlohmann::json j = domain::issue_to_json(candidate.issue);
  j["found_in_state"] = candidate.found_in_state;
  j["rank"] = candidate.rank;
  j["priority_level"] = priorities.level_name(candidate.rank);
  j["branch"] = workflow::branch_name_for(candidate.issue);
  return j;
}

nlohmann::json receipt_to_json(const workflow::TransitionReceipt& receipt) {
  return nlohmann::json{{"issue_id", receipt.issue_id.value},
                        {"from", receipt.from_state},
                        {"to", receipt.to_state},
                        {"native_state", domain::backend_state_to_json(receipt.native_state)}};
}

nlohmann::json report_to_json(const workflow::StatusReport& report) {
  nlohmann::json j;
  j["scope"] = report.scope.has_value() ? nlohmann::json(report.scope.value()) : nlohmann::json();
  j["total"] = report.total;

  j["by_state"] = nlohmann::json::array();
  for (const auto& group : report.by_state) {
    j["by_state"].push_back({{"state", group.state},
                             {"recognised", group.recognised},
                             {"count", group.issues.size()},
                             {"issues", domain::issues_to_json(group.issues)}});
  }

  j["by_label"] = nlohmann::json::array();
  for (const auto& group : report.by_label) {
    nlohmann::json ids = nlohmann::json::array();
    for (const auto& id : group.issue_ids) {
      ids.push_back(id.value);
    }
    j["by_label"].push_back({{"label", group.label}, {"issue_ids", ids}});
  }

  j["by_priority"] = nlohmann::json::array();
  for (const auto& level : report.by_priority) {
    j["by_priority"].push_back(
        {{"level", level.level}, {"rank", level.rank}, {"count", level.count}});
  }
  return j;
}

nlohmann::json catalog_to_json(const app::WorkflowCatalog& catalog) {
  nlohmann::json j;
  j["canonical"] = nlohmann::json::array();
  for (const auto& state : catalog.canonical) {
    j["canonical"].push_back({{"name", state.canonical_name},
                              {"ownership", std::string(domain::ownership_to_string(
                                                state.ownership))},
                              {"order", state.order},
                              {"description", state.description}});
  }
  j["backend"] = nlohmann::json::array();
  for (const auto& state : catalog.backend) {
    j["backend"].push_back(domain::backend_state_to_json(state));
  }
  j["valid"] = catalog.check.valid;
  j["found"] = catalog.check.found;
  j["missing"] = catalog.check.missing;
  j["extra"] = catalog.check.extra;
  return j;
}

nlohmann::json workflow_error_to_json(const core::WorkflowError& error) {
  std::string kind = "backend_error";
  if (error.kind == core::WorkflowErrorKind::kUnknownState) {
    kind = "unknown_state";
  } else if (error.kind == core::WorkflowErrorKind::kIllegalTransition) {
    kind = "illegal_transition";
  }
  return nlohmann::json{{"error", kind},
                        {"message", error.message},
                        {"requested", error.requested},
                        {"from", error.from_state},
                        {"to", error.to_state},
                        {"alternatives", error.alternatives}};
}

}  // namespace devflow::cli
