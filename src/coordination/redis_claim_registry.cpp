#include "devflow/coordination/redis_claim_registry.h"

#include <stdexcept>
#include <sw/redis++/redis++.h>
#include <utility>
#include <vector>

namespace devflow::coordination {

namespace {

// Lua script for releasing a claim only when the caller still holds it.
// KEYS[1] = claim key, ARGV[1] = worker id. Returns 1 if deleted, 0 otherwise.
constexpr const char* kReleaseScript = R"LUA(
if redis.call('GET', KEYS[1]) == ARGV[1] then
  return redis.call('DEL', KEYS[1])
end
return 0
)LUA";

}  // namespace

RedisClaimRegistry::RedisClaimRegistry(const std::string& redis_uri, std::string key_prefix)
    : key_prefix_(std::move(key_prefix)) {
  try {
    redis_ = std::make_unique<sw::redis::Redis>(redis_uri);
    // Test connection
    redis_->ping();
    release_script_sha_ = redis_->script_load(kReleaseScript);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisClaimRegistry::~RedisClaimRegistry() = default;

std::string RedisClaimRegistry::claim_key(const core::IssueId& issue_id) const {
  return key_prefix_ + issue_id.value;
}

ClaimResult RedisClaimRegistry::try_claim(const core::IssueId& issue_id,
                                          const core::WorkerId& worker_id,
                                          const std::chrono::seconds ttl) {
  try {
    const std::string key = claim_key(issue_id);

    if (redis_->set(key, worker_id.value, ttl, sw::redis::UpdateType::NOT_EXIST)) {
      return ClaimResult{ClaimOutcome::kClaimed, worker_id.value, ""};
    }

    const auto current = redis_->get(key);
    if (!current) {
      // Expired between SET and GET; the next pickup run will see it free.
      return ClaimResult{ClaimOutcome::kHeldByOther, "", ""};
    }
    if (*current == worker_id.value) {
      redis_->expire(key, ttl);
      return ClaimResult{ClaimOutcome::kAlreadyHeld, worker_id.value, ""};
    }
    return ClaimResult{ClaimOutcome::kHeldByOther, *current, ""};

  } catch (const std::exception& e) {
    return ClaimResult{ClaimOutcome::kBackendError, "", "Redis error: " + std::string(e.what())};
  }
}

bool RedisClaimRegistry::release(const core::IssueId& issue_id, const core::WorkerId& worker_id) {
  try {
    std::vector<std::string> keys = {claim_key(issue_id)};
    std::vector<std::string> args = {worker_id.value};

    sw::redis::StringView script_sha{release_script_sha_};
    const auto deleted = redis_->evalsha<long long>(script_sha, keys.begin(), keys.end(),
                                                    args.begin(), args.end());
    return deleted == 1;

  } catch (const std::exception& /*e*/) {
    return false;
  }
}

std::optional<std::string> RedisClaimRegistry::holder(const core::IssueId& issue_id) const {
  try {
    const auto current = redis_->get(claim_key(issue_id));
    if (!current) {
      return std::nullopt;
    }
    return *current;

  } catch (const std::exception& /*e*/) {
    return std::nullopt;
  }
}

}  // namespace devflow::coordination
