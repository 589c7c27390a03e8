#pragma once

#include "devflow/app/workflow_service.h"
#include "devflow/domain/issue.h"
#include "devflow/storage/audit_event.h"
#include "devflow/workflow/flavor.h"
#include "devflow/workflow/issue_selector.h"
#include "devflow/workflow/report.h"
#include "devflow/workflow/transition_applier.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace devflow::cli {

// Table renderers produce the plain-text lines devflow prints on stdout.
// Every function returns text ending in '\n' (or "" when there is nothing).

// "#42: Title [P: HIGH, bug] (dev ready)" on the board;
// "ASA-7: Title [High] (Todo)" on linear. Missing state reads "no status".
[[nodiscard]] std::string format_issue_line(const workflow::WorkflowFlavor& flavor,
                                            const domain::Issue& issue);

[[nodiscard]] std::string render_issue_list(const workflow::WorkflowFlavor& flavor,
                                            const std::vector<domain::Issue>& issues);

[[nodiscard]] std::string render_pickup(const workflow::WorkflowFlavor& flavor,
                                        const workflow::PickupCandidate& candidate,
                                        const workflow::PriorityModel& priorities);

[[nodiscard]] std::string render_queue(const workflow::WorkflowFlavor& flavor,
                                       const std::vector<workflow::PickupCandidate>& queue,
                                       const workflow::PriorityModel& priorities);

[[nodiscard]] std::string render_issue_detail(const workflow::WorkflowFlavor& flavor,
                                              const domain::Issue& issue);

[[nodiscard]] std::string render_report(const workflow::WorkflowFlavor& flavor,
                                        const workflow::StatusReport& report);

[[nodiscard]] std::string render_catalog(const workflow::WorkflowFlavor& flavor,
                                         const app::WorkflowCatalog& catalog,
                                         const std::string& backend_name);

[[nodiscard]] std::string render_audit_trail(const std::vector<storage::AuditEvent>& events);

// ── JSON (--format json) ──────────────────────────────────────────

[[nodiscard]] nlohmann::json candidate_to_json(const workflow::PickupCandidate& candidate,
                                               const workflow::PriorityModel& priorities);
[[nodiscard]] nlohmann::json receipt_to_json(const workflow::TransitionReceipt& receipt);
[[nodiscard]] nlohmann::json report_to_json(const workflow::StatusReport& report);
[[nodiscard]] nlohmann::json catalog_to_json(const app::WorkflowCatalog& catalog);
[[nodiscard]] nlohmann::json workflow_error_to_json(const core::WorkflowError& error);

// "Title Case" for report headings: first letter of each space-separated word upper-cased.
[[nodiscard]] std::string title_case(const std::string& text);

}  // namespace devflow::cli
