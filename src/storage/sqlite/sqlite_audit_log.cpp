#include "devflow/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace devflow::storage::sqlite {

namespace {

constexpr const char* kInsertEvent = R"(
  INSERT INTO audit_events
    (event_id, trace_id, event_type, payload, created_at, refs_json, idx)
  VALUES (?1, ?2, ?3, ?4, ?5, ?6,
          (SELECT COALESCE(MAX(idx), -1) + 1 FROM audit_events WHERE trace_id = ?2))
)";

constexpr const char* kSelectColumns =
    "SELECT event_id, trace_id, event_type, payload, created_at, refs_json FROM audit_events";

std::vector<std::string> refs_from_json(const std::string& text) {
  std::vector<std::string> refs;
  const auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (!parsed.is_array()) {
    return refs;
  }
  for (const auto& ref : parsed) {
    if (ref.is_string()) {
      refs.push_back(ref.get<std::string>());
    }
  }
  return refs;
}

AuditEvent read_event(const Statement& row) {
  return AuditEvent{row.text(0), row.text(1), row.text(2), row.text(3),
                    row.text(4), refs_from_json(row.text(5))};
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteAuditLog::append(const AuditEvent& event) {
  auto checked = check_appendable(event);
  if (!checked.has_value()) {
    return checked;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  // idx is computed from rows already in the file, so the read and the insert
  // must share one write transaction.
  Transaction tx(*db_);
  if (!tx.begin_error().empty()) {
    return core::Result<bool, std::string>::err(tx.begin_error());
  }

  const std::string refs = nlohmann::json(event.refs).dump();
  Statement insert(*db_, kInsertEvent);
  insert.bind(1, event.event_id)
      .bind(2, event.trace_id)
      .bind(3, event.event_type)
      .bind(4, event.payload)
      .bind(5, event.created_at)
      .bind(6, refs);

  if (insert.step() != Statement::Step::kDone) {
    const std::string reason = "Failed to append audit event " + event.event_id + ": " +
                               insert.error();
    auto rolled_back = tx.rollback();
    if (!rolled_back.has_value()) {
      return core::Result<bool, std::string>::err(reason + "; " + rolled_back.error());
    }
    return core::Result<bool, std::string>::err(reason);
  }

  return tx.commit();
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<AuditEvent> events;
  if (trace_id.empty()) {
    Statement select(*db_, std::string(kSelectColumns) + " ORDER BY rowid");
    while (select.step() == Statement::Step::kRow) {
      events.push_back(read_event(select));
    }
    return events;
  }

  Statement select(*db_, std::string(kSelectColumns) + " WHERE trace_id = ?1 ORDER BY idx");
  select.bind(1, trace_id);
  while (select.step() == Statement::Step::kRow) {
    events.push_back(read_event(select));
  }
  return events;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> ids;
  Statement select(*db_, "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  while (select.step() == Statement::Step::kRow) {
    ids.push_back(select.text(0));
  }
  return ids;
}

}  // namespace devflow::storage::sqlite
