#include "devflow/storage/audit_log.h"

namespace devflow::storage {

core::Result<bool, std::string> check_appendable(const AuditEvent& event) {
  if (event.event_id.empty() || event.trace_id.empty()) {
    return core::Result<bool, std::string>::err("Audit event requires event_id and trace_id");
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> InMemoryAuditLog::append(const AuditEvent& event) {
  auto checked = check_appendable(event);
  if (!checked.has_value()) {
    return checked;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!event_ids_.insert(event.event_id).second) {
    return core::Result<bool, std::string>::err("Duplicate audit event id: " + event.event_id);
  }
  positions_by_trace_[event.trace_id].push_back(events_.size());
  events_.push_back(event);
  return checked;
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (trace_id.empty()) {
    return events_;
  }

  const auto found = positions_by_trace_.find(trace_id);
  if (found == positions_by_trace_.end()) {
    return {};
  }
  std::vector<AuditEvent> trail;
  trail.reserve(found->second.size());
  for (const auto position : found->second) {
    trail.push_back(events_[position]);
  }
  return trail;
}

std::vector<std::string> InMemoryAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(positions_by_trace_.size());
  for (const auto& [trace_id, positions] : positions_by_trace_) {
    ids.push_back(trace_id);
  }
  return ids;
}

}  // namespace devflow::storage
