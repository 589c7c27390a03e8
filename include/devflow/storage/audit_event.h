#pragma once

#include <string>
#include <vector>

namespace devflow::storage {

// Event types written by the workflow service.
namespace event_type {
inline constexpr const char* kPickupSelected = "PickupSelected";
inline constexpr const char* kPickupEmpty = "PickupEmpty";
inline constexpr const char* kIssueClaimed = "IssueClaimed";
inline constexpr const char* kClaimSkipped = "ClaimSkipped";
inline constexpr const char* kTransitionApplied = "TransitionApplied";
inline constexpr const char* kTransitionRejected = "TransitionRejected";
inline constexpr const char* kCommentPosted = "CommentPosted";
inline constexpr const char* kPullRequestCreated = "PullRequestCreated";
}  // namespace event_type

// One row of the audit trail. Events sharing a trace_id belong to a single
// devflow invocation and are returned in append order.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;     // JSON object text
  std::string created_at;  // ISO 8601 UTC
  std::vector<std::string> refs;  // issue ids
};

}  // namespace devflow::storage
