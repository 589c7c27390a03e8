#include "devflow/tracker/inmemory_issue_tracker.h"
#include "devflow/workflow/flavor.h"
#include "devflow/workflow/issue_selector.h"

#include <catch2/catch_test_macros.hpp>

#include "test_support.h"
#include <optional>
#include <string>
#include <vector>

using namespace devflow;
using testing::make_issue;

namespace {

struct SelectorFixture {
  tracker::InMemoryIssueTracker tracker{"fixture"};
  workflow::StateVocabulary vocabulary{workflow::board_flavor().states};
  workflow::PriorityModel priorities{workflow::board_flavor().priorities};
  workflow::IssueSelector selector{tracker, vocabulary, priorities};

  SelectorFixture() {
    tracker.set_workflow_states(testing::board_columns());
    tracker.upsert(make_issue("1", "Todo", {"P: low"}, "2026-01-01T00:00:00Z"));
    tracker.upsert(make_issue("2", "Dev Ready", {"P: HIGH"}, "2026-01-03T00:00:00Z"));
    tracker.upsert(make_issue("3", "In Progress", {"P: Critical"}, "2026-01-01T00:00:00Z"));
    tracker.upsert(make_issue("4", "Dev Ready", {"P: HIGH"}, "2026-01-02T00:00:00Z"));
    tracker.upsert(make_issue("5", "Todo", {}, "2025-12-01T00:00:00Z"));
  }
};

std::vector<std::string> ids_of(const std::vector<workflow::PickupCandidate>& candidates) {
  std::vector<std::string> ids;
  for (const auto& candidate : candidates) {
    ids.push_back(candidate.issue.id.value);
  }
  return ids;
}

}  // namespace

TEST_CASE("rank_candidates: merges eligible states, best first", "[selector]") {
  SelectorFixture f;

  const auto ranked = f.selector.rank_candidates({"todo", "dev ready"}, std::nullopt);
  REQUIRE(ranked.has_value());
  CHECK(ids_of(ranked.value()) == std::vector<std::string>{"4", "2", "1", "5"});
  CHECK(ranked.value().front().found_in_state == "dev ready");
  CHECK(ranked.value().front().rank == 1);
  CHECK(f.tracker.list_calls() == 2);
}

TEST_CASE("pickup: returns the head of the queue", "[selector]") {
  SelectorFixture f;

  const auto picked = f.selector.pickup({"todo", "dev ready"}, std::nullopt);
  REQUIRE(picked.has_value());
  REQUIRE(picked.value().has_value());
  CHECK(picked.value()->issue.id.value == "4");
}

TEST_CASE("pickup: nothing eligible is not an error", "[selector]") {
  SelectorFixture f;

  const auto picked = f.selector.pickup({"review"}, std::nullopt);
  REQUIRE(picked.has_value());
  CHECK_FALSE(picked.value().has_value());
}

TEST_CASE("rank_candidates: unknown state fails before any fetch", "[selector]") {
  SelectorFixture f;

  const auto ranked = f.selector.rank_candidates({"todo", "icebox"}, std::nullopt);
  REQUIRE_FALSE(ranked.has_value());
  CHECK(ranked.error().kind == core::WorkflowErrorKind::kUnknownState);
  CHECK(ranked.error().requested == "icebox");
  CHECK(ranked.error().alternatives == f.vocabulary.canonical_names());
  CHECK(f.tracker.list_calls() == 0);
}

TEST_CASE("rank_candidates: spellings of one state are scanned once", "[selector]") {
  SelectorFixture f;

  const auto ranked = f.selector.rank_candidates({"todo", "To Do", "TODO"}, std::nullopt);
  REQUIRE(ranked.has_value());
  CHECK(ids_of(ranked.value()) == std::vector<std::string>{"1", "5"});
  CHECK(f.tracker.list_calls() == 1);
}

TEST_CASE("rank_candidates: scope restricts candidates", "[selector]") {
  SelectorFixture f;
  auto scoped = make_issue("6", "Todo", {"P: low"}, "2026-03-01T00:00:00Z");
  scoped.scope = "Phase 1";
  f.tracker.upsert(scoped);

  const auto ranked = f.selector.rank_candidates({"todo", "dev ready"}, std::string{"Phase 1"});
  REQUIRE(ranked.has_value());
  CHECK(ids_of(ranked.value()) == std::vector<std::string>{"6"});
}

TEST_CASE("rank_candidates: backend failure is a BackendError", "[selector]") {
  SelectorFixture f;
  f.tracker.set_failure(std::string{"API rate limit exceeded"});

  const auto ranked = f.selector.rank_candidates({"todo"}, std::nullopt);
  REQUIRE_FALSE(ranked.has_value());
  CHECK(ranked.error().kind == core::WorkflowErrorKind::kBackendError);
  CHECK(ranked.error().message == "API rate limit exceeded");
}

TEST_CASE("rank_candidates: board columns named by aliases are still scanned", "[selector]") {
  tracker::InMemoryIssueTracker tracker{"fixture"};
  tracker.set_workflow_states({
      {"opt-todo", "To Do"},     {"opt-plan", "Planning"},     {"opt-ready", "Ready"},
      {"opt-prog", "WIP"},       {"opt-review", "In Review"}, {"opt-done", "Done"},
  });
  tracker.upsert(make_issue("10", "To Do", {"P: low"}, "2026-01-01T00:00:00Z"));
  tracker.upsert(make_issue("11", "Ready", {"P: HIGH"}, "2026-01-01T00:00:00Z"));
  tracker.upsert(make_issue("12", "WIP", {"P: Critical"}, "2026-01-01T00:00:00Z"));
  tracker.upsert(make_issue("13", "In Review", {"P: Critical"}, "2026-01-01T00:00:00Z"));

  const workflow::StateVocabulary vocabulary{workflow::board_flavor().states};
  const workflow::PriorityModel priorities{workflow::board_flavor().priorities};
  const workflow::IssueSelector selector{tracker, vocabulary, priorities};

  const auto ranked = selector.rank_candidates({"todo", "dev ready"}, std::nullopt);
  REQUIRE(ranked.has_value());
  CHECK(ids_of(ranked.value()) == std::vector<std::string>{"11", "10"});
  CHECK(ranked.value()[0].found_in_state == "dev ready");

  const auto working = selector.rank_candidates({"in progress"}, std::nullopt);
  REQUIRE(working.has_value());
  CHECK(ids_of(working.value()) == std::vector<std::string>{"12"});
}

TEST_CASE("pickup: considers every candidate, not just the first hundred", "[selector]") {
  tracker::InMemoryIssueTracker tracker{"fixture"};
  tracker.set_workflow_states(testing::board_columns());
  for (int i = 1; i <= 100; ++i) {
    tracker.upsert(make_issue(std::to_string(i), "Dev Ready", {"P: low"}, "2025-06-01T00:00:00Z"));
  }
  tracker.upsert(make_issue("500", "Dev Ready", {"P: Critical"}, "2026-01-01T00:00:00Z"));

  const workflow::StateVocabulary vocabulary{workflow::board_flavor().states};
  const workflow::PriorityModel priorities{workflow::board_flavor().priorities};
  const workflow::IssueSelector selector{tracker, vocabulary, priorities};

  const auto picked = selector.pickup({"dev ready"}, std::nullopt);
  REQUIRE(picked.has_value());
  REQUIRE(picked.value().has_value());
  CHECK(picked.value()->issue.id.value == "500");

  const auto ranked = selector.rank_candidates({"dev ready"}, std::nullopt);
  REQUIRE(ranked.has_value());
  CHECK(ranked.value().size() == 101);
}
