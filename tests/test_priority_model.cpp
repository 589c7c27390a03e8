#include "devflow/workflow/flavor.h"
#include "devflow/workflow/priority_model.h"

#include <catch2/catch_test_macros.hpp>

#include "test_support.h"
#include <stdexcept>
#include <vector>

using namespace devflow;
using testing::make_issue;
using workflow::PriorityModel;

TEST_CASE("rank: board labels match case-insensitively", "[priority]") {
  const PriorityModel model(workflow::board_flavor().priorities);

  CHECK(model.rank(make_issue("1", "todo", {"P: HIGH"})) == 1);
  CHECK(model.rank(make_issue("2", "todo", {"high"})) == 1);
  CHECK(model.rank(make_issue("3", "todo", {"  p: critical "})) == 0);
  CHECK(model.rank(make_issue("4", "todo", {"bug"})) == 4);
  CHECK(model.rank(make_issue("5", "todo")) == 4);
}

TEST_CASE("rank: most urgent label wins", "[priority]") {
  const PriorityModel model(workflow::board_flavor().priorities);
  CHECK(model.rank(make_issue("1", "todo", {"P: low", "bug", "P: Critical"})) == 0);
}

TEST_CASE("rank: linear priority codes", "[priority]") {
  const PriorityModel model(workflow::linear_flavor().priorities);

  auto urgent = make_issue("ENG-1", "Todo");
  urgent.priority_code = 1;
  CHECK(model.rank(urgent) == 1);

  auto none = make_issue("ENG-2", "Todo");
  none.priority_code = 0;
  CHECK(model.rank(none) == 5);

  auto missing = make_issue("ENG-3", "Todo");
  CHECK(model.rank(missing) == 5);

  auto unmapped = make_issue("ENG-4", "Todo");
  unmapped.priority_code = 9;
  CHECK(model.rank(unmapped) == 5);
}

TEST_CASE("compare: rank first, then oldest created_at", "[priority][ordering]") {
  const PriorityModel model(workflow::board_flavor().priorities);

  const auto high_new = make_issue("1", "todo", {"P: HIGH"}, "2026-01-03T00:00:00Z");
  const auto high_old = make_issue("2", "todo", {"P: HIGH"}, "2026-01-01T00:00:00Z");
  const auto low_old = make_issue("3", "todo", {"P: low"}, "2025-06-01T00:00:00Z");

  CHECK(model.precedes(high_old, high_new));
  CHECK(model.precedes(high_new, low_old));
  CHECK(model.compare(high_new, high_new) == 0);
  CHECK(model.compare(low_old, high_old) == 1);
}

TEST_CASE("compare: missing created_at sorts after dated issues", "[priority][ordering]") {
  const PriorityModel model(workflow::board_flavor().priorities);

  const auto undated = make_issue("1", "todo", {"P: HIGH"});
  const auto dated = make_issue("2", "todo", {"P: HIGH"}, "2026-05-01T00:00:00Z");
  CHECK(model.precedes(dated, undated));
  CHECK_FALSE(model.precedes(undated, dated));
}

TEST_CASE("compare: created_at is ordered by instant, not text", "[priority][ordering]") {
  const PriorityModel model(workflow::board_flavor().priorities);

  // 09:00+02:00 is 07:00Z, so it is older than 08:00Z despite sorting later as text.
  const auto offset = make_issue("1", "todo", {"P: HIGH"}, "2026-01-01T09:00:00+02:00");
  const auto utc = make_issue("2", "todo", {"P: HIGH"}, "2026-01-01T08:00:00Z");
  CHECK(model.precedes(offset, utc));

  const auto fraction = make_issue("3", "todo", {"P: HIGH"}, "2026-01-01T08:00:00.250Z");
  CHECK(model.precedes(utc, fraction));

  const auto same_instant = make_issue("4", "todo", {"P: HIGH"}, "2026-01-01T07:00:00Z");
  CHECK(model.compare(offset, same_instant) == 0);
}

TEST_CASE("compare_created_at: unparsable text sorts between dated and missing",
          "[priority][ordering]") {
  CHECK(workflow::compare_created_at("2026-01-01T00:00:00Z", "yesterday") == -1);
  CHECK(workflow::compare_created_at("yesterday", "") == -1);
  CHECK(workflow::compare_created_at("", "2026-01-01T00:00:00Z") == 1);
  CHECK(workflow::compare_created_at("abc", "abd") == -1);
  CHECK(workflow::compare_created_at("", "") == 0);
}

TEST_CASE("sort: stable for full ties", "[priority][ordering]") {
  const PriorityModel model(workflow::board_flavor().priorities);

  std::vector<domain::Issue> issues = {
      make_issue("10", "todo", {"bug"}),
      make_issue("11", "todo", {"P: Medium"}, "2026-01-01T00:00:00Z"),
      make_issue("12", "todo", {"docs"}),
      make_issue("13", "todo", {"P: Critical"}, "2026-02-01T00:00:00Z"),
  };
  model.sort(issues);

  REQUIRE(issues.size() == 4);
  CHECK(issues[0].id.value == "13");
  CHECK(issues[1].id.value == "11");
  CHECK(issues[2].id.value == "10");
  CHECK(issues[3].id.value == "12");
}

TEST_CASE("level_name: table name or unranked name", "[priority]") {
  const PriorityModel board(workflow::board_flavor().priorities);
  CHECK(board.level_name(1) == "P: HIGH");
  CHECK(board.level_name(4) == "No priority");

  const PriorityModel linear(workflow::linear_flavor().priorities);
  CHECK(linear.level_name(2) == "High");
}

TEST_CASE("PriorityModel rejects a level ranked worse than unranked", "[priority]") {
  workflow::PriorityTable table;
  table.levels = {{"Someday", 9, {"someday"}, {}}};
  table.unranked = 4;
  CHECK_THROWS_AS(PriorityModel(table), std::invalid_argument);
}
