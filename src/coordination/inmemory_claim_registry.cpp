#include "devflow/coordination/inmemory_claim_registry.h"

namespace devflow::coordination {

ClaimResult InMemoryClaimRegistry::try_claim(const core::IssueId& issue_id,
                                             const core::WorkerId& worker_id,
                                             const std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = claims_.find(issue_id);
  if (it == claims_.end()) {
    claims_.emplace(issue_id, Claim{worker_id.value, ttl});
    return ClaimResult{ClaimOutcome::kClaimed, worker_id.value, ""};
  }
  if (it->second.worker == worker_id.value) {
    it->second.ttl = ttl;
    return ClaimResult{ClaimOutcome::kAlreadyHeld, worker_id.value, ""};
  }
  return ClaimResult{ClaimOutcome::kHeldByOther, it->second.worker, ""};
}

bool InMemoryClaimRegistry::release(const core::IssueId& issue_id,
                                    const core::WorkerId& worker_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = claims_.find(issue_id);
  if (it == claims_.end() || it->second.worker != worker_id.value) {
    return false;
  }
  claims_.erase(it);
  return true;
}

std::optional<std::string> InMemoryClaimRegistry::holder(const core::IssueId& issue_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = claims_.find(issue_id);
  if (it == claims_.end()) {
    return std::nullopt;
  }
  return it->second.worker;
}

}  // namespace devflow::coordination
