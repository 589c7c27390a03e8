#include <catch2/catch_test_macros.hpp>

#include "backend_factory.h"
#include "config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace devflow;
using namespace devflow::cli;

namespace {

std::filesystem::path write_fixture(const std::string& contents) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    ("devflow_fixture_" + std::to_string(stamp) + ".json");
  std::ofstream out(path);
  out << contents;
  return path;
}

CliConfig fixture_config(const std::filesystem::path& path) {
  CliConfig config;
  config.command = "list";
  config.backend = BackendKind::kFixture;
  config.fixture_path = path.string();
  return config;
}

}  // namespace

TEST_CASE("open_backend: fixture file loads issues and flavor", "[backend][fixture]") {
  const auto path = write_fixture(R"({
    "flavor": "linear",
    "states": [{"id": "st-todo", "name": "Todo"}, {"id": "st-prog", "name": "In Progress"}],
    "issues": [{"id": "ENG-1", "title": "First", "state": "Todo", "priority": 2}]
  })");

  const auto opened = open_backend(fixture_config(path), core::map_env({}));
  REQUIRE(opened.has_value());
  const auto& runtime = *opened.value();

  CHECK(runtime.flavor == &workflow::linear_flavor());
  CHECK(runtime.tracker->backend_name() == "fixture");
  CHECK(claim_key_prefix(runtime) == "devflow:claim:fixture:" + path.string() + ":");

  const auto issues = runtime.tracker->list_issues({});
  REQUIRE(issues.has_value());
  REQUIRE(issues.value().size() == 1);
  CHECK(issues.value()[0].id.value == "ENG-1");
  CHECK(runtime.tracker->list_workflow_states().value().size() == 2);

  std::filesystem::remove(path);
}

TEST_CASE("open_backend: fixture flavor defaults to board", "[backend][fixture]") {
  const auto path = write_fixture(R"({"issues": []})");

  const auto opened = open_backend(fixture_config(path), core::map_env({}));
  REQUIRE(opened.has_value());
  CHECK(opened.value()->flavor == &workflow::board_flavor());

  std::filesystem::remove(path);
}

TEST_CASE("open_backend: bad fixtures are configuration errors", "[backend][fixture]") {
  SECTION("unknown flavor") {
    const auto path = write_fixture(R"({"flavor": "jira"})");
    const auto opened = open_backend(fixture_config(path), core::map_env({}));
    REQUIRE_FALSE(opened.has_value());
    CHECK(opened.error().find("unknown flavor 'jira'") != std::string::npos);
    std::filesystem::remove(path);
  }

  SECTION("malformed JSON") {
    const auto path = write_fixture("{ not json");
    const auto opened = open_backend(fixture_config(path), core::map_env({}));
    REQUIRE_FALSE(opened.has_value());
    CHECK(opened.error().rfind("Error: invalid fixture", 0) == 0);
    std::filesystem::remove(path);
  }

  SECTION("missing file") {
    const auto opened = open_backend(
        fixture_config(std::filesystem::temp_directory_path() / "devflow_no_such_fixture.json"),
        core::map_env({}));
    REQUIRE_FALSE(opened.has_value());
    CHECK(opened.error().rfind("Error: cannot read fixture file", 0) == 0);
  }
}

TEST_CASE("open_backend: missing credentials", "[backend]") {
  SECTION("github") {
    CliConfig config;
    config.command = "list";
    config.repo = "octo/widgets";
    const auto opened = open_backend(config, core::map_env({}));
    REQUIRE_FALSE(opened.has_value());
    CHECK(opened.error().find("GITHUB_TOKEN") != std::string::npos);
  }

  SECTION("linear") {
    CliConfig config;
    config.command = "list";
    config.backend = BackendKind::kLinear;
    const auto opened = open_backend(config, core::map_env({}));
    REQUIRE_FALSE(opened.has_value());
    CHECK(opened.error().rfind("Error: No Linear authentication", 0) == 0);
  }
}

TEST_CASE("open_backend: only the github backend opens pull requests", "[backend]") {
  CliConfig github;
  github.command = "complete";
  github.repo = "octo/widgets";
  const auto opened = open_backend(github, core::map_env({{"GITHUB_TOKEN", "tok"}}));
  REQUIRE(opened.has_value());
  CHECK(opened.value()->pull_requests != nullptr);
  CHECK(opened.value()->tracker->backend_name() == "github");

  const auto path = write_fixture(R"({"issues": []})");
  const auto fixture = open_backend(fixture_config(path), core::map_env({}));
  REQUIRE(fixture.has_value());
  CHECK(fixture.value()->pull_requests == nullptr);
  std::filesystem::remove(path);
}
