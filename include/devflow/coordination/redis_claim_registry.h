#pragma once

#include "devflow/coordination/claim_registry.h"

#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace devflow::coordination {

// RedisClaimRegistry shares claims between workers on different machines.
//
// Redis data model:
// - Claim: {key_prefix}{issue_id} (string) = worker id, with TTL
//
// Atomicity:
// - try_claim is SET NX EX; only one worker can create the key
// - release is a Lua compare-and-delete, so a worker never removes a claim
//   that expired and was taken over by someone else
class RedisClaimRegistry final : public IClaimRegistry {
 public:
  // key_prefix scopes claims to one board or team, e.g. "devflow:claim:github:owner/repo:".
  // Throws std::runtime_error if the connection fails.
  RedisClaimRegistry(const std::string& redis_uri, std::string key_prefix);

  ~RedisClaimRegistry() override;

  RedisClaimRegistry(const RedisClaimRegistry&) = delete;
  RedisClaimRegistry& operator=(const RedisClaimRegistry&) = delete;
  RedisClaimRegistry(RedisClaimRegistry&&) = delete;
  RedisClaimRegistry& operator=(RedisClaimRegistry&&) = delete;

  [[nodiscard]] ClaimResult try_claim(const core::IssueId& issue_id,
                                      const core::WorkerId& worker_id,
                                      std::chrono::seconds ttl) override;

  bool release(const core::IssueId& issue_id, const core::WorkerId& worker_id) override;

  [[nodiscard]] std::optional<std::string> holder(const core::IssueId& issue_id) const override;

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
  std::string key_prefix_;

  // Lua script SHA for compare-and-delete
  std::string release_script_sha_;

  [[nodiscard]] std::string claim_key(const core::IssueId& issue_id) const;
};

}  // namespace devflow::coordination
