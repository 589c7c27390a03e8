#pragma once

#include "devflow/coordination/claim_registry.h"

#include <map>
#include <mutex>
#include <string>

namespace devflow::coordination {

// InMemoryClaimRegistry is the single-process registry used by tests.
// TTLs are recorded but never enforced: a claim lasts until released.
class InMemoryClaimRegistry final : public IClaimRegistry {
 public:
  InMemoryClaimRegistry() = default;
  ~InMemoryClaimRegistry() override = default;

  InMemoryClaimRegistry(const InMemoryClaimRegistry&) = delete;
  InMemoryClaimRegistry& operator=(const InMemoryClaimRegistry&) = delete;
  InMemoryClaimRegistry(InMemoryClaimRegistry&&) = delete;
  InMemoryClaimRegistry& operator=(InMemoryClaimRegistry&&) = delete;

  [[nodiscard]] ClaimResult try_claim(const core::IssueId& issue_id,
                                      const core::WorkerId& worker_id,
                                      std::chrono::seconds ttl) override;

  bool release(const core::IssueId& issue_id, const core::WorkerId& worker_id) override;

  [[nodiscard]] std::optional<std::string> holder(const core::IssueId& issue_id) const override;

 private:
  struct Claim {
    std::string worker;
    std::chrono::seconds ttl{0};
  };

  mutable std::mutex mutex_;
  std::map<core::IssueId, Claim> claims_;
};

}  // namespace devflow::coordination
