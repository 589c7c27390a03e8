#pragma once

#include "devflow/core/ids.h"

#include <chrono>
#include <optional>
#include <string>

namespace devflow::coordination {

// ClaimOutcome is the result of asking for a time-limited reservation of an issue.
enum class ClaimOutcome {
  kClaimed,       // no previous holder; the caller now holds the claim
  kAlreadyHeld,   // the caller already held it; the TTL was refreshed
  kHeldByOther,   // another worker holds it; the caller must skip the issue
  kBackendError,  // the registry could not be reached
};

struct ClaimResult {
  ClaimOutcome outcome{ClaimOutcome::kBackendError};
  std::string holder;  // worker holding the claim after the call, if known
  std::string error_message;
};

inline constexpr std::chrono::seconds kDefaultClaimTtl{3600};

// IClaimRegistry closes the pickup race between independent workers: before an
// agent starts on an issue it claims it here, and a claim held by someone else
// means "pick the next one".
//
// Claims expire on their own after the TTL; release() only ever removes a claim
// the given worker holds.
class IClaimRegistry {
 public:
  virtual ~IClaimRegistry() = default;

  [[nodiscard]] virtual ClaimResult try_claim(const core::IssueId& issue_id,
                                              const core::WorkerId& worker_id,
                                              std::chrono::seconds ttl) = 0;

  // Returns true if a claim held by worker_id was removed.
  virtual bool release(const core::IssueId& issue_id, const core::WorkerId& worker_id) = 0;

  [[nodiscard]] virtual std::optional<std::string> holder(const core::IssueId& issue_id) const = 0;

 protected:
  IClaimRegistry() = default;
  IClaimRegistry(const IClaimRegistry&) = default;
  IClaimRegistry& operator=(const IClaimRegistry&) = default;
  IClaimRegistry(IClaimRegistry&&) = default;
  IClaimRegistry& operator=(IClaimRegistry&&) = default;
};

}  // namespace devflow::coordination
