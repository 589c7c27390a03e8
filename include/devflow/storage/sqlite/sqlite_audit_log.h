#pragma once

#include "devflow/storage/audit_log.h"
#include "devflow/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace devflow::storage::sqlite {

// SqliteAuditLog implements IAuditLog on the audit_events table.
// Events within a trace are ordered by the idx column, assigned at append
// time as MAX(idx)+1 inside a transaction so two processes sharing the file
// never reuse an index.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
};

}  // namespace devflow::storage::sqlite
