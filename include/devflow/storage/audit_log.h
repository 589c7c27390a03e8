#pragma once

#include "devflow/core/result.h"
#include "devflow/storage/audit_event.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace devflow::storage {

// Checks shared by every IAuditLog: event_id and trace_id must be set.
[[nodiscard]] core::Result<bool, std::string> check_appendable(const AuditEvent& event);

// IAuditLog is an append-only, per-trace ordered event log. Appending an
// event_id that is already stored fails and leaves the log unchanged.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;

  [[nodiscard]] virtual core::Result<bool, std::string> append(const AuditEvent& event) = 0;

  // Events for trace_id in append order. An empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;

  // Distinct trace IDs stored in this log, sorted.
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;

 protected:
  IAuditLog() = default;
  IAuditLog(const IAuditLog&) = default;
  IAuditLog& operator=(const IAuditLog&) = default;
  IAuditLog(IAuditLog&&) = default;
  IAuditLog& operator=(IAuditLog&&) = default;
};

// Process-local log used when no --audit-db is given.
class InMemoryAuditLog final : public IAuditLog {
 public:
  InMemoryAuditLog() = default;

  [[nodiscard]] core::Result<bool, std::string> append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
  std::set<std::string> event_ids_;
  std::map<std::string, std::vector<std::size_t>> positions_by_trace_;
};

}  // namespace devflow::storage
