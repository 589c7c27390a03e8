#include "devflow/app/workflow_service.h"
#include "devflow/coordination/inmemory_claim_registry.h"
#include "devflow/core/clock.h"
#include "devflow/core/id_generator.h"
#include "devflow/storage/audit_log.h"
#include "devflow/tracker/inmemory_issue_tracker.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "test_support.h"

#include <optional>
#include <string>
#include <vector>

using namespace devflow;

namespace {

// Appends always fail, the way a read-only audit database would.
class FailingAuditLog final : public storage::IAuditLog {
 public:
  core::Result<bool, std::string> append(const storage::AuditEvent& /*event*/) override {
    return core::Result<bool, std::string>::err("disk full");
  }
  std::vector<storage::AuditEvent> query(const std::string& /*trace_id*/) const override {
    return {};
  }
  std::vector<std::string> list_trace_ids() const override { return {}; }
};

// Records each draft; answers with a fixed url, or fails when told to.
class RecordingPullRequestHost final : public tracker::IPullRequestHost {
 public:
  core::Result<tracker::PullRequest, core::BackendError> create_pull_request(
      const tracker::PullRequestDraft& draft) override {
    drafts.push_back(draft);
    if (failure.has_value()) {
      return core::Result<tracker::PullRequest, core::BackendError>::err(
          core::BackendError{failure.value()});
    }
    return core::Result<tracker::PullRequest, core::BackendError>::ok(
        tracker::PullRequest{"https://github.com/octo/widgets/pull/41", 41});
  }

  std::vector<tracker::PullRequestDraft> drafts;
  std::optional<std::string> failure;
};

// Board with three pickup-eligible issues and one in progress:
//   4 todo P: Critical, 2 dev ready P: HIGH, 1 todo P: low, 3 in progress unlabelled.
struct BoardFixture {
  tracker::InMemoryIssueTracker tracker;
  storage::InMemoryAuditLog audit_log;
  coordination::InMemoryClaimRegistry claims;
  core::SequentialIdGenerator id_gen;
  core::FixedClock clock{std::chrono::sys_days{std::chrono::year{2026} / 1 / 1}};
  app::Services services{tracker, audit_log, &claims, id_gen, clock, nullptr};

  BoardFixture() {
    tracker.set_workflow_states(testing::board_columns());
    tracker.upsert(testing::make_issue("1", "Todo", {"P: low"}, "2026-01-01T00:00:00Z"));
    tracker.upsert(testing::make_issue("2", "Dev Ready", {"P: HIGH"}, "2026-01-02T00:00:00Z"));
    tracker.upsert(testing::make_issue("3", "In Progress", {}, "2026-01-03T00:00:00Z"));
    tracker.upsert(testing::make_issue("4", "Todo", {"P: Critical"}, "2026-01-04T00:00:00Z"));
  }
};

std::vector<std::string> event_types(const app::WorkflowService& service) {
  std::vector<std::string> types;
  for (const auto& event : service.audit_trail()) {
    types.push_back(event.event_type);
  }
  return types;
}

}  // namespace

// ── Reads ───────────────────────────────────────────────────────────────────

TEST_CASE("WorkflowService: list_issues sorts by priority", "[service][list]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto all = service.list_issues(std::nullopt, std::nullopt);
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 4);
  CHECK(all.value()[0].id.value == "4");
  CHECK(all.value()[1].id.value == "2");
  CHECK(all.value()[2].id.value == "1");
  CHECK(all.value()[3].id.value == "3");

  // Aliases are normalized before the backend sees them.
  const auto ready = service.list_issues(std::string("ready"), std::nullopt);
  REQUIRE(ready.has_value());
  REQUIRE(ready.value().size() == 1);
  CHECK(ready.value()[0].id.value == "2");
}

TEST_CASE("WorkflowService: list_issues --status matches alias-named columns", "[service][list]") {
  BoardFixture f;
  f.tracker.set_workflow_states({
      {"opt-todo", "To Do"},     {"opt-plan", "Planning"},     {"opt-ready", "Ready"},
      {"opt-prog", "WIP"},       {"opt-review", "In Review"}, {"opt-done", "Done"},
  });
  f.tracker.upsert(testing::make_issue("20", "In Review", {}, "2026-01-05T00:00:00Z"));
  f.tracker.upsert(testing::make_issue("21", "WIP", {}, "2026-01-05T00:00:00Z"));
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto review = service.list_issues(std::string("review"), std::nullopt);
  REQUIRE(review.has_value());
  REQUIRE(review.value().size() == 1);
  CHECK(review.value()[0].id.value == "20");

  const auto working = service.list_issues(std::string("in progress"), std::nullopt);
  REQUIRE(working.has_value());
  REQUIRE(working.value().size() == 2);
}

TEST_CASE("WorkflowService: list_issues honours the limit", "[service][list]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto limited = service.list_issues(std::nullopt, std::nullopt, 2);
  REQUIRE(limited.has_value());
  CHECK(limited.value().size() == 2);
}

TEST_CASE("WorkflowService: backend failures surface as kBackendError", "[service][list]") {
  BoardFixture f;
  f.tracker.set_failure("rate limited");
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result = service.list_issues(std::nullopt, std::nullopt);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::WorkflowErrorKind::kBackendError);
  CHECK(result.error().message == "rate limited");
}

// ── Pickup ──────────────────────────────────────────────────────────────────

TEST_CASE("WorkflowService: pickup is a pure read with one audit event", "[service][pickup]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto picked = service.pickup(std::nullopt, std::nullopt);
  REQUIRE(picked.has_value());
  REQUIRE(picked.value().has_value());
  CHECK(picked.value()->issue.id.value == "4");
  CHECK(picked.value()->found_in_state == "todo");
  CHECK(f.tracker.set_state_calls() == 0);

  const auto trail = service.audit_trail();
  REQUIRE(trail.size() == 1);
  CHECK(trail[0].event_type == "PickupSelected");
  CHECK(trail[0].trace_id == "trace-0");
  CHECK(trail[0].event_id == "evt-1");
  CHECK(trail[0].created_at == "2026-01-01T00:00:00Z");
  CHECK(trail[0].refs == std::vector<std::string>{"4"});
  CHECK(service.trace_id() == "trace-0");
}

TEST_CASE("WorkflowService: nothing eligible", "[service][pickup]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto picked = service.pickup(std::vector<std::string>{"review"}, std::nullopt);
  REQUIRE(picked.has_value());
  CHECK_FALSE(picked.value().has_value());
  CHECK(event_types(service) == std::vector<std::string>{"PickupEmpty"});
}

TEST_CASE("WorkflowService: unknown pickup state fails before any read", "[service][pickup]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto queue = service.queue(std::vector<std::string>{"todo", "someday"}, std::nullopt);
  REQUIRE_FALSE(queue.has_value());
  CHECK(queue.error().kind == core::WorkflowErrorKind::kUnknownState);
  CHECK(queue.error().alternatives.size() == 6);
  CHECK(f.tracker.list_calls() == 0);
}

TEST_CASE("WorkflowService: queue ranks every candidate", "[service][pickup]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto queue = service.queue(std::nullopt, std::nullopt);
  REQUIRE(queue.has_value());
  REQUIRE(queue.value().size() == 3);
  CHECK(queue.value()[0].issue.id.value == "4");
  CHECK(queue.value()[1].issue.id.value == "2");
  CHECK(queue.value()[2].issue.id.value == "1");
  CHECK(service.audit_trail().empty());
}

// ── Claimed pickup ──────────────────────────────────────────────────────────

TEST_CASE("WorkflowService: pickup_and_claim claims and moves the best issue",
          "[service][claim]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result =
      service.pickup_and_claim(std::nullopt, std::nullopt, core::WorkerId{"agent-a"});
  REQUIRE(result.has_value());
  REQUIRE(result.value().has_value());

  const auto& claimed = result.value().value();
  CHECK(claimed.candidate.issue.id.value == "4");
  CHECK(claimed.claim_registered);
  CHECK(claimed.skipped.empty());
  CHECK(claimed.receipt.from_state == "todo");
  CHECK(claimed.receipt.to_state == "in progress");
  CHECK(claimed.receipt.native_state.id == "opt-prog");

  CHECK(f.claims.holder(core::IssueId{"4"}) == std::optional<std::string>{"agent-a"});
  CHECK(f.tracker.get_issue(core::IssueId{"4"}).value().current_state == "In Progress");
  CHECK(event_types(service) ==
        std::vector<std::string>{"IssueClaimed", "TransitionApplied", "PickupSelected"});
}

TEST_CASE("WorkflowService: issues claimed by another worker are skipped", "[service][claim]") {
  BoardFixture f;
  REQUIRE(f.claims.try_claim(core::IssueId{"4"}, core::WorkerId{"other"}, std::chrono::seconds{60})
              .outcome == coordination::ClaimOutcome::kClaimed);
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result =
      service.pickup_and_claim(std::nullopt, std::nullopt, core::WorkerId{"agent-a"});
  REQUIRE(result.has_value());
  REQUIRE(result.value().has_value());
  CHECK(result.value()->candidate.issue.id.value == "2");
  CHECK(result.value()->skipped == std::vector<std::string>{"4"});
  CHECK(event_types(service) == std::vector<std::string>{"ClaimSkipped", "IssueClaimed",
                                                         "TransitionApplied", "PickupSelected"});

  // Issue 4 is untouched.
  CHECK(f.tracker.get_issue(core::IssueId{"4"}).value().current_state == "Todo");
}

TEST_CASE("WorkflowService: without a registry the move still happens", "[service][claim]") {
  BoardFixture f;
  f.services.claims = nullptr;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result =
      service.pickup_and_claim(std::nullopt, std::nullopt, core::WorkerId{"agent-a"});
  REQUIRE(result.has_value());
  REQUIRE(result.value().has_value());
  CHECK_FALSE(result.value()->claim_registered);
  CHECK(event_types(service) ==
        std::vector<std::string>{"TransitionApplied", "PickupSelected"});
}

TEST_CASE("WorkflowService: a failed move releases the claim", "[service][claim]") {
  BoardFixture f;
  // The board has no "In Progress" column.
  f.tracker.set_workflow_states({{"opt-todo", "Todo"}, {"opt-ready", "Dev Ready"}});
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result =
      service.pickup_and_claim(std::nullopt, std::nullopt, core::WorkerId{"agent-a"});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::WorkflowErrorKind::kBackendError);
  CHECK(result.error().message.find("is not configured on fixture") != std::string::npos);

  CHECK_FALSE(f.claims.holder(core::IssueId{"4"}).has_value());
  CHECK(service.warnings().empty());
  CHECK(f.tracker.set_state_calls() == 0);
}

TEST_CASE("WorkflowService: all candidates held elsewhere", "[service][claim]") {
  BoardFixture f;
  for (const std::string id : {"1", "2", "4"}) {
    REQUIRE(f.claims.try_claim(core::IssueId{id}, core::WorkerId{"other"}, std::chrono::seconds{60})
                .outcome == coordination::ClaimOutcome::kClaimed);
  }
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result =
      service.pickup_and_claim(std::nullopt, std::nullopt, core::WorkerId{"agent-a"});
  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().has_value());
  CHECK(event_types(service).back() == "PickupEmpty");
  CHECK(f.tracker.set_state_calls() == 0);
}

// ── Move / comment ──────────────────────────────────────────────────────────

TEST_CASE("WorkflowService: illegal move is rejected without a write", "[service][move]") {
  BoardFixture f;
  f.tracker.upsert(testing::make_issue("5", "Done"));
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result = service.move(core::IssueId{"5"}, "todo");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::WorkflowErrorKind::kIllegalTransition);
  CHECK(result.error().alternatives == std::vector<std::string>{"done"});
  CHECK(f.tracker.set_state_calls() == 0);
  CHECK(event_types(service) == std::vector<std::string>{"TransitionRejected"});
}

TEST_CASE("WorkflowService: allowed backward move", "[service][move]") {
  BoardFixture f;
  f.tracker.upsert(testing::make_issue("6", "Review"));
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result = service.move(core::IssueId{"6"}, "Dev-Ready");
  REQUIRE(result.has_value());
  CHECK(result.value().from_state == "review");
  CHECK(result.value().to_state == "dev ready");
  CHECK(f.tracker.get_issue(core::IssueId{"6"}).value().current_state == "Dev Ready");
}

TEST_CASE("WorkflowService: move of a missing issue", "[service][move]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result = service.move(core::IssueId{"99"}, "review");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::WorkflowErrorKind::kBackendError);
  CHECK(result.error().message == "Issue 99 not found");
}

TEST_CASE("WorkflowService: comment posts and audits", "[service][comment]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  REQUIRE(service.comment(core::IssueId{"2"}, "Starting now").has_value());
  CHECK(f.tracker.comment_calls() == 1);
  CHECK(f.tracker.get_issue(core::IssueId{"2"}).value().comments.back().body == "Starting now");
  CHECK(event_types(service) == std::vector<std::string>{"CommentPosted"});
}

// ── Complete ────────────────────────────────────────────────────────────────

TEST_CASE("WorkflowService: complete posts the summary and moves to review",
          "[service][complete]") {
  BoardFixture f;
  auto issue = testing::make_issue("7", "In Progress");
  issue.title = "Fix login bug";
  f.tracker.upsert(issue);
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result = service.complete(app::CompletionRequest{
      core::IssueId{"7"}, "Reworked the session check", 90, std::string("12 passed")});

  REQUIRE(result.has_value());
  CHECK(result.value().branch == "issue/7-fix-login-bug");
  CHECK(result.value().receipt.to_state == "review");
  CHECK(f.tracker.comment_calls() == 1);
  CHECK(f.tracker.get_issue(core::IssueId{"7"}).value().current_state == "Review");
  CHECK_FALSE(result.value().pull_request.has_value());
  CHECK(result.value().comment_body.find("- PR:") == std::string::npos);
  CHECK(event_types(service) ==
        std::vector<std::string>{"CommentPosted", "TransitionApplied"});
}

TEST_CASE("WorkflowService: complete opens a pull request before commenting",
          "[service][complete]") {
  BoardFixture f;
  RecordingPullRequestHost host;
  f.services.pull_requests = &host;
  auto issue = testing::make_issue("7", "In Progress");
  issue.title = "Fix login bug";
  f.tracker.upsert(issue);
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result = service.complete(app::CompletionRequest{
      core::IssueId{"7"}, "Reworked the session check", 90, std::string("12 passed")});

  REQUIRE(result.has_value());
  REQUIRE(host.drafts.size() == 1);
  CHECK(host.drafts[0].title == "#7: Fix login bug");
  CHECK(host.drafts[0].head_branch == "issue/7-fix-login-bug");
  CHECK(host.drafts[0].body ==
        "## Summary\nReworked the session check\n\n"
        "## Test Results\n```\n12 passed\n```\n\n"
        "## Confidence Score: 90/100\n\n"
        "Closes #7\n");
  CHECK(result.value().pull_request ==
        std::optional<std::string>{"https://github.com/octo/widgets/pull/41"});
  CHECK(result.value().comment_body.find("- PR: https://github.com/octo/widgets/pull/41\n") !=
        std::string::npos);
  CHECK(event_types(service) == std::vector<std::string>{"PullRequestCreated", "CommentPosted",
                                                         "TransitionApplied"});
  CHECK(service.warnings().empty());
}

TEST_CASE("WorkflowService: a failed pull request does not stop completion",
          "[service][complete]") {
  BoardFixture f;
  RecordingPullRequestHost host;
  host.failure = "A pull request already exists for octo:issue/7-fix-login-bug.";
  f.services.pull_requests = &host;
  auto issue = testing::make_issue("7", "In Progress");
  issue.title = "Fix login bug";
  f.tracker.upsert(issue);
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result = service.complete(
      app::CompletionRequest{core::IssueId{"7"}, "Summary", 60, std::nullopt});

  REQUIRE(result.has_value());
  CHECK(result.value().pull_request == std::optional<std::string>{"(PR creation failed)"});
  CHECK(result.value().comment_body.find("- PR: (PR creation failed)\n") != std::string::npos);
  CHECK(f.tracker.comment_calls() == 1);
  CHECK(f.tracker.get_issue(core::IssueId{"7"}).value().current_state == "Review");
  REQUIRE(service.warnings().size() == 1);
  CHECK(service.warnings()[0].find("already exists") != std::string::npos);
}

TEST_CASE("WorkflowService: rejected completion opens no pull request", "[service][complete]") {
  BoardFixture f;
  RecordingPullRequestHost host;
  f.services.pull_requests = &host;
  f.tracker.upsert(testing::make_issue("8", "Done"));
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result =
      service.complete(app::CompletionRequest{core::IssueId{"8"}, "Summary", 50, std::nullopt});

  REQUIRE_FALSE(result.has_value());
  CHECK(host.drafts.empty());
}

TEST_CASE("WorkflowService: rejected completion posts nothing", "[service][complete]") {
  BoardFixture f;
  f.tracker.upsert(testing::make_issue("8", "Done"));
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto result =
      service.complete(app::CompletionRequest{core::IssueId{"8"}, "Summary", 50, std::nullopt});

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::WorkflowErrorKind::kIllegalTransition);
  CHECK(f.tracker.comment_calls() == 0);
  CHECK(f.tracker.set_state_calls() == 0);
  CHECK(event_types(service) == std::vector<std::string>{"TransitionRejected"});
}

TEST_CASE("format_completion_comment: board layout", "[service][complete]") {
  auto issue = testing::make_issue("7", "In Progress");
  issue.title = "Fix login bug";
  issue.url = "https://github.com/octo/widgets/issues/7";

  const auto body = app::format_completion_comment(
      workflow::board_flavor(), issue,
      app::CompletionRequest{core::IssueId{"7"}, "Did it", 90, std::string("12 passed")});

  CHECK(body ==
        "## Implementation Complete for #7\n\n"
        "### Summary\nDid it\n\n"
        "### Test Results\n```\n12 passed\n```\n\n"
        "### Confidence Score: 90/100\n\n"
        "### Ready for Review\n"
        "- Branch: `issue/7-fix-login-bug`\n"
        "- Issue: https://github.com/octo/widgets/issues/7\n");
}

TEST_CASE("format_completion_comment: linear layout ends with the review footer",
          "[service][complete]") {
  auto issue = testing::make_issue("ENG-3", "In Progress");
  issue.title = "Add API";

  const auto body = app::format_completion_comment(
      workflow::linear_flavor(), issue,
      app::CompletionRequest{core::IssueId{"ENG-3"}, "S", 70, std::nullopt});

  CHECK(body ==
        "## Implementation Complete for ENG-3\n\n"
        "### Summary\nS\n\n"
        "### Confidence Score: 70/100\n\n"
        "### Ready for Review\n"
        "- Branch: `issue/eng-3-add-api`\n"
        "\n---\n" +
            workflow::linear_flavor().review_footer + "\n");
}

// ── Catalog / report ────────────────────────────────────────────────────────

TEST_CASE("WorkflowService: workflow_catalog lines the board up", "[service][catalog]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto catalog = service.workflow_catalog();
  REQUIRE(catalog.has_value());
  CHECK(catalog.value().canonical.size() == 6);
  CHECK(catalog.value().backend.size() == 6);
  CHECK(catalog.value().check.valid);
  CHECK(catalog.value().check.missing.empty());
}

TEST_CASE("WorkflowService: report includes every issue", "[service][report]") {
  BoardFixture f;
  app::WorkflowService service(f.services, workflow::board_flavor());

  const auto report = service.report(std::nullopt);
  REQUIRE(report.has_value());
  CHECK(report.value().total == 4);
  CHECK_FALSE(report.value().scope.has_value());
}

// ── Audit failures ──────────────────────────────────────────────────────────

TEST_CASE("WorkflowService: audit failures become warnings", "[service][audit]") {
  BoardFixture f;
  FailingAuditLog failing;
  app::Services services{f.tracker, failing, nullptr, f.id_gen, f.clock, nullptr};
  app::WorkflowService service(services, workflow::board_flavor());

  const auto picked = service.pickup(std::nullopt, std::nullopt);
  REQUIRE(picked.has_value());
  CHECK(picked.value().has_value());
  CHECK(service.warnings() == std::vector<std::string>{"PickupSelected: disk full"});
}
