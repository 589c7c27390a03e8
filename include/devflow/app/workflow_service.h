#pragma once

#include "devflow/coordination/claim_registry.h"
#include "devflow/core/clock.h"
#include "devflow/core/id_generator.h"
#include "devflow/core/ids.h"
#include "devflow/core/result.h"
#include "devflow/domain/issue.h"
#include "devflow/storage/audit_event.h"
#include "devflow/storage/audit_log.h"
#include "devflow/tracker/issue_tracker.h"
#include "devflow/tracker/pull_request_host.h"
#include "devflow/workflow/flavor.h"
#include "devflow/workflow/issue_selector.h"
#include "devflow/workflow/priority_model.h"
#include "devflow/workflow/report.h"
#include "devflow/workflow/state_vocabulary.h"
#include "devflow/workflow/transition_applier.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace devflow::app {

// Services bundles the collaborators a WorkflowService runs against.
// It holds references (not ownership); the CLI composition root owns the
// concrete instances. claims is null when no claim registry is configured;
// pull_requests is null for backends that do not host code.
struct Services {
  tracker::IIssueTracker& tracker;           // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;             // NOLINT(readability-identifier-naming)
  coordination::IClaimRegistry* claims;      // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;                // NOLINT(readability-identifier-naming)
  core::IClock& clock;                       // NOLINT(readability-identifier-naming)
  tracker::IPullRequestHost* pull_requests;  // NOLINT(readability-identifier-naming)
};

// ────────────────────────────────────────────────────────────────
// Requests / responses
// ────────────────────────────────────────────────────────────────

struct ClaimedPickup {
  workflow::PickupCandidate candidate;   // NOLINT(readability-identifier-naming)
  workflow::TransitionReceipt receipt;   // NOLINT(readability-identifier-naming)
  bool claim_registered{false};          // NOLINT(readability-identifier-naming)
  std::vector<std::string> skipped;      // NOLINT(readability-identifier-naming)
};

struct CompletionRequest {
  core::IssueId issue_id;                   // NOLINT(readability-identifier-naming)
  std::string summary;                      // NOLINT(readability-identifier-naming)
  int confidence{0};                        // NOLINT(readability-identifier-naming)
  std::optional<std::string> test_results;  // NOLINT(readability-identifier-naming)
};

// Text of the PR line in the completion comment when the host rejected the PR.
inline constexpr const char* kPullRequestFailed = "(PR creation failed)";

struct CompletionResult {
  domain::Issue issue;                  // NOLINT(readability-identifier-naming)
  std::string branch;                   // NOLINT(readability-identifier-naming)
  std::string comment_body;             // NOLINT(readability-identifier-naming)
  workflow::TransitionReceipt receipt;  // NOLINT(readability-identifier-naming)
  // Set when a pull request host is wired: the PR url, or kPullRequestFailed.
  std::optional<std::string> pull_request;  // NOLINT(readability-identifier-naming)
};

// WorkflowCatalog is what `devflow states` prints: the canonical catalog plus
// how the backend's own state list lines up against it.
struct WorkflowCatalog {
  std::vector<domain::WorkflowState> canonical;     // NOLINT(readability-identifier-naming)
  std::vector<domain::BackendState> backend;        // NOLINT(readability-identifier-naming)
  workflow::CatalogCheck check;                     // NOLINT(readability-identifier-naming)
};

// Renders the markdown comment posted by complete(). The branch line always
// appears; test results, the PR line and the issue link appear when present;
// the flavor's review footer closes the comment when it has one.
[[nodiscard]] std::string format_completion_comment(
    const workflow::WorkflowFlavor& flavor, const domain::Issue& issue,
    const CompletionRequest& request, const std::optional<std::string>& pull_request = std::nullopt);

// The pull request complete() opens: "#12: Title", a body ending in
// "Closes #12", headed by the issue's branch.
[[nodiscard]] tracker::PullRequestDraft format_pull_request(const workflow::WorkflowFlavor& flavor,
                                                            const domain::Issue& issue,
                                                            const CompletionRequest& request);

// ────────────────────────────────────────────────────────────────
// WorkflowService
// ────────────────────────────────────────────────────────────────

// WorkflowService is the one application-layer entry point the CLI calls.
// Every operation of one service instance shares a single trace id, so the
// audit trail of one CLI run can be fetched with audit_trail().
//
// Emits audit events: PickupSelected, PickupEmpty, IssueClaimed, ClaimSkipped,
// TransitionApplied, TransitionRejected, CommentPosted, PullRequestCreated.
class WorkflowService {
 public:
  WorkflowService(Services& services, const workflow::WorkflowFlavor& flavor);

  WorkflowService(const WorkflowService&) = delete;
  WorkflowService& operator=(const WorkflowService&) = delete;
  WorkflowService(WorkflowService&&) = delete;
  WorkflowService& operator=(WorkflowService&&) = delete;
  ~WorkflowService() = default;

  // Issues in a state, sorted by priority. A recognised status matches every
  // backend spelling of it; an unrecognised one is passed through verbatim.
  // limit caps how many issues the backend returns (0 reads them all).
  [[nodiscard]] core::Result<std::vector<domain::Issue>, core::WorkflowError> list_issues(
      const std::optional<std::string>& status, const std::optional<std::string>& scope,
      int limit = 0);

  // Ranked pickup queue; states default to the flavor's pickup states.
  [[nodiscard]] core::Result<std::vector<workflow::PickupCandidate>, core::WorkflowError> queue(
      const std::optional<std::vector<std::string>>& states,
      const std::optional<std::string>& scope);

  // Pure read: the best candidate, or nullopt when none is eligible.
  [[nodiscard]] core::Result<std::optional<workflow::PickupCandidate>, core::WorkflowError>
  pickup(const std::optional<std::vector<std::string>>& states,
         const std::optional<std::string>& scope);

  // Claim the best unclaimed candidate and move it to the work state.
  // Candidates held by another worker are skipped. If the move fails, the
  // claim is released and the error returned.
  [[nodiscard]] core::Result<std::optional<ClaimedPickup>, core::WorkflowError> pickup_and_claim(
      const std::optional<std::vector<std::string>>& states,
      const std::optional<std::string>& scope, const core::WorkerId& worker,
      std::chrono::seconds ttl = coordination::kDefaultClaimTtl);

  [[nodiscard]] core::Result<domain::Issue, core::WorkflowError> show(const core::IssueId& id);

  [[nodiscard]] core::Result<domain::Issue, core::WorkflowError> comment(const core::IssueId& id,
                                                                        const std::string& body);

  [[nodiscard]] core::Result<workflow::TransitionReceipt, core::WorkflowError> move(
      const core::IssueId& id, const std::string& target);

  // Validates the move to the review state first, so a rejected completion
  // posts nothing. With a pull request host the PR is opened before the
  // comment; a failed PR is a warning and the completion carries on.
  [[nodiscard]] core::Result<CompletionResult, core::WorkflowError> complete(
      const CompletionRequest& request);

  // Report over all issues in scope, closed ones included.
  [[nodiscard]] core::Result<workflow::StatusReport, core::WorkflowError> report(
      const std::optional<std::string>& scope);

  [[nodiscard]] core::Result<WorkflowCatalog, core::WorkflowError> workflow_catalog();

  [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
  [[nodiscard]] std::vector<storage::AuditEvent> audit_trail() const;

  // Failed audit appends, unreleased claims and failed pull requests; the CLI
  // prints them as WARNING lines.
  [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }

  [[nodiscard]] const workflow::WorkflowFlavor& flavor() const { return flavor_; }
  [[nodiscard]] const workflow::StateVocabulary& vocabulary() const { return vocabulary_; }
  [[nodiscard]] const workflow::PriorityModel& priorities() const { return priorities_; }

 private:
  void emit(const std::string& event_type, const std::string& payload,
            const std::vector<std::string>& refs);
  [[nodiscard]] core::Result<domain::Issue, core::WorkflowError> fetch_issue(
      const core::IssueId& id);
  [[nodiscard]] core::Result<workflow::TransitionReceipt, core::WorkflowError> apply_move(
      const domain::Issue& issue, const std::string& target);
  [[nodiscard]] std::vector<std::string> resolve_states(
      const std::optional<std::vector<std::string>>& states) const;

  Services& services_;
  const workflow::WorkflowFlavor& flavor_;
  workflow::StateVocabulary vocabulary_;
  workflow::PriorityModel priorities_;
  workflow::IssueSelector selector_;
  workflow::TransitionApplier applier_;
  std::string trace_id_;
  std::vector<std::string> warnings_;
};

}  // namespace devflow::app
