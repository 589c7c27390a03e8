#include "devflow/coordination/inmemory_claim_registry.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace devflow;
using coordination::ClaimOutcome;

TEST_CASE("InMemoryClaimRegistry: first claim wins", "[claims]") {
  coordination::InMemoryClaimRegistry registry;
  const core::IssueId issue{"42"};

  const auto first = registry.try_claim(issue, core::WorkerId{"agent-a"}, std::chrono::seconds{60});
  CHECK(first.outcome == ClaimOutcome::kClaimed);
  CHECK(first.holder == "agent-a");

  const auto second =
      registry.try_claim(issue, core::WorkerId{"agent-b"}, std::chrono::seconds{60});
  CHECK(second.outcome == ClaimOutcome::kHeldByOther);
  CHECK(second.holder == "agent-a");
  CHECK(registry.holder(issue) == std::optional<std::string>{"agent-a"});
}

TEST_CASE("InMemoryClaimRegistry: re-claim by the holder refreshes", "[claims]") {
  coordination::InMemoryClaimRegistry registry;
  const core::IssueId issue{"42"};
  const core::WorkerId worker{"agent-a"};

  REQUIRE(registry.try_claim(issue, worker, std::chrono::seconds{60}).outcome ==
          ClaimOutcome::kClaimed);
  CHECK(registry.try_claim(issue, worker, std::chrono::seconds{120}).outcome ==
        ClaimOutcome::kAlreadyHeld);
}

TEST_CASE("InMemoryClaimRegistry: only the holder can release", "[claims]") {
  coordination::InMemoryClaimRegistry registry;
  const core::IssueId issue{"ENG-9"};

  REQUIRE(registry.try_claim(issue, core::WorkerId{"agent-a"}, std::chrono::seconds{60}).outcome ==
          ClaimOutcome::kClaimed);
  CHECK_FALSE(registry.release(issue, core::WorkerId{"agent-b"}));
  CHECK(registry.holder(issue).has_value());

  CHECK(registry.release(issue, core::WorkerId{"agent-a"}));
  CHECK_FALSE(registry.holder(issue).has_value());
  CHECK_FALSE(registry.release(issue, core::WorkerId{"agent-a"}));

  CHECK(registry.try_claim(issue, core::WorkerId{"agent-b"}, std::chrono::seconds{60}).outcome ==
        ClaimOutcome::kClaimed);
}
