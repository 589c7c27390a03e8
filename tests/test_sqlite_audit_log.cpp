#include "devflow/storage/sqlite/sqlite_audit_log.h"
#include "devflow/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using namespace devflow;

namespace {

std::shared_ptr<storage::sqlite::SqliteDb> open_memory_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->migrate().has_value());
  return db;
}

}  // namespace

TEST_CASE("SqliteDb: migrations apply once", "[sqlite][schema]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();

  CHECK(db->schema_version() == 0);
  REQUIRE(db->migrate().has_value());
  CHECK(db->schema_version() == storage::sqlite::kAuditSchemaVersion);
  REQUIRE(db->migrate().has_value());
  CHECK(db->schema_version() == storage::sqlite::kAuditSchemaVersion);
}

TEST_CASE("SqliteDb: statements and transactions", "[sqlite]") {
  auto db = storage::sqlite::SqliteDb::open(":memory:").value();
  REQUIRE(db->exec("CREATE TABLE kv (k TEXT PRIMARY KEY, v TEXT)").has_value());

  {
    storage::sqlite::Transaction tx(*db);
    REQUIRE(tx.begin_error().empty());
    storage::sqlite::Statement insert(*db, "INSERT INTO kv VALUES (?1, ?2)");
    insert.bind(1, "claimed").bind(2, "yes");
    CHECK(insert.step() == storage::sqlite::Statement::Step::kDone);
    // Leaving scope without commit discards the row.
  }
  {
    storage::sqlite::Statement count(*db, "SELECT COUNT(*) FROM kv");
    REQUIRE(count.step() == storage::sqlite::Statement::Step::kRow);
    CHECK(count.integer(0) == 0);
  }

  storage::sqlite::Statement broken(*db, "SELECT nope FROM missing_table");
  CHECK_FALSE(broken.is_valid());
  CHECK_FALSE(broken.error().empty());
  CHECK(broken.step() == storage::sqlite::Statement::Step::kError);
}

TEST_CASE("SqliteAuditLog append and query", "[sqlite][audit]") {
  storage::sqlite::SqliteAuditLog audit_log(open_memory_db());

  const std::string trace_id = "trace-001";
  REQUIRE(audit_log
              .append({"evt-001", trace_id, "PickupSelected", R"({"issue_id":"42"})",
                       "2026-01-01T00:00:00Z", {"42"}})
              .has_value());
  REQUIRE(audit_log
              .append({"evt-002", trace_id, "IssueClaimed", R"({"worker_id":"a"})",
                       "2026-01-01T00:00:01Z", {"42"}})
              .has_value());
  REQUIRE(audit_log
              .append({"evt-003", trace_id, "PickupEmpty", "{}", "2026-01-01T00:00:02Z", {}})
              .has_value());

  const auto events = audit_log.query(trace_id);
  REQUIRE(events.size() == 3);

  // Append order is preserved through idx
  CHECK(events[0].event_id == "evt-001");
  CHECK(events[1].event_id == "evt-002");
  CHECK(events[2].event_id == "evt-003");

  CHECK(events[0].event_type == "PickupSelected");
  CHECK(events[0].payload == R"({"issue_id":"42"})");
  CHECK(events[0].created_at == "2026-01-01T00:00:00Z");
  CHECK(events[0].refs == std::vector<std::string>{"42"});
  CHECK(events[2].refs.empty());
}

TEST_CASE("SqliteAuditLog multiple traces", "[sqlite][audit]") {
  storage::sqlite::SqliteAuditLog audit_log(open_memory_db());

  REQUIRE(audit_log.append({"evt-1b", "trace-B", "Event1", "{}", "2026-01-01T00:00:00Z", {}})
              .has_value());
  REQUIRE(audit_log.append({"evt-1a", "trace-A", "Event1", "{}", "2026-01-01T00:00:00Z", {}})
              .has_value());
  REQUIRE(audit_log.append({"evt-2a", "trace-A", "Event2", "{}", "2026-01-01T00:00:01Z", {}})
              .has_value());

  const auto events_a = audit_log.query("trace-A");
  REQUIRE(events_a.size() == 2);
  CHECK(events_a[0].event_id == "evt-1a");
  CHECK(events_a[1].event_id == "evt-2a");

  CHECK(audit_log.query("trace-B").size() == 1);
  CHECK(audit_log.query("trace-C").empty());

  const auto everything = audit_log.query("");
  REQUIRE(everything.size() == 3);
  CHECK(everything[0].event_id == "evt-1b");

  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"trace-A", "trace-B"});
}

TEST_CASE("SqliteAuditLog rejects incomplete and duplicate events", "[sqlite][audit]") {
  storage::sqlite::SqliteAuditLog audit_log(open_memory_db());

  CHECK_FALSE(audit_log.append({"", "trace-1", "Event", "{}", "", {}}).has_value());
  CHECK_FALSE(audit_log.append({"evt-1", "", "Event", "{}", "", {}}).has_value());

  REQUIRE(audit_log.append({"evt-1", "trace-1", "Event", "{}", "", {}}).has_value());
  const auto duplicate = audit_log.append({"evt-1", "trace-1", "Event", "{}", "", {}});
  CHECK_FALSE(duplicate.has_value());

  // The failed insert was rolled back; the log keeps accepting events.
  REQUIRE(audit_log.append({"evt-2", "trace-1", "Event", "{}", "", {}}).has_value());
  CHECK(audit_log.query("trace-1").size() == 2);
}

TEST_CASE("SqliteAuditLog continues a trace across connections", "[sqlite][audit]") {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    ("devflow_audit_" + std::to_string(stamp) + ".db");

  {
    auto db = storage::sqlite::SqliteDb::open(path.string());
    REQUIRE(db.has_value());
    REQUIRE(db.value()->migrate().has_value());
    storage::sqlite::SqliteAuditLog first_run(db.value());
    REQUIRE(first_run.append({"evt-1", "trace-x", "PickupSelected", "{}", "", {"1"}}).has_value());
  }
  {
    auto db = storage::sqlite::SqliteDb::open(path.string());
    REQUIRE(db.has_value());
    REQUIRE(db.value()->migrate().has_value());
    storage::sqlite::SqliteAuditLog second_run(db.value());
    REQUIRE(second_run.append({"evt-2", "trace-x", "TransitionApplied", "{}", "", {"1"}})
                .has_value());

    const auto events = second_run.query("trace-x");
    REQUIRE(events.size() == 2);
    CHECK(events[0].event_id == "evt-1");
    CHECK(events[1].event_id == "evt-2");
  }

  std::filesystem::remove(path);
}
