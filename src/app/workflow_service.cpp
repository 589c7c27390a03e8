#include "devflow/app/workflow_service.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace devflow::app {

namespace {

core::WorkflowError backend_failure(const core::BackendError& error) {
  return core::WorkflowError{.kind = core::WorkflowErrorKind::kBackendError,
                             .message = error.message,
                             .requested = "",
                             .from_state = "",
                             .to_state = "",
                             .alternatives = {}};
}

std::string kind_to_string(const core::WorkflowErrorKind kind) {
  switch (kind) {
    case core::WorkflowErrorKind::kUnknownState:
      return "unknown_state";
    case core::WorkflowErrorKind::kIllegalTransition:
      return "illegal_transition";
    case core::WorkflowErrorKind::kBackendError:
      return "backend_error";
  }
  return "backend_error";
}

std::string claim_outcome_to_string(const coordination::ClaimOutcome outcome) {
  switch (outcome) {
    case coordination::ClaimOutcome::kClaimed:
      return "claimed";
    case coordination::ClaimOutcome::kAlreadyHeld:
      return "already_held";
    case coordination::ClaimOutcome::kHeldByOther:
      return "held_by_other";
    case coordination::ClaimOutcome::kBackendError:
      return "backend_error";
  }
  return "backend_error";
}

}  // namespace

std::string format_completion_comment(const workflow::WorkflowFlavor& flavor,
                                      const domain::Issue& issue,
                                      const CompletionRequest& request,
                                      const std::optional<std::string>& pull_request) {
  std::string body = "## Implementation Complete for " + flavor.issue_ref_prefix +
                     issue.id.value + "\n\n";
  body += "### Summary\n" + request.summary + "\n\n";

  if (request.test_results.has_value()) {
    body += "### Test Results\n```\n" + request.test_results.value() + "\n```\n\n";
  }

  body += "### Confidence Score: " + std::to_string(request.confidence) + "/100\n\n";
  body += "### Ready for Review\n";
  body += "- Branch: `" + workflow::branch_name_for(issue) + "`\n";
  if (pull_request.has_value()) {
    body += "- PR: " + pull_request.value() + "\n";
  }
  if (!issue.url.empty()) {
    body += "- Issue: " + issue.url + "\n";
  }

  if (!flavor.review_footer.empty()) {
    body += "\n---\n" + flavor.review_footer + "\n";
  }
  return body;
}

tracker::PullRequestDraft format_pull_request(const workflow::WorkflowFlavor& flavor,
                                              const domain::Issue& issue,
                                              const CompletionRequest& request) {
  const std::string ref = flavor.issue_ref_prefix + issue.id.value;
  tracker::PullRequestDraft draft;
  draft.title = ref + ": " + issue.title;
  draft.body = "## Summary\n" + request.summary + "\n\n";
  draft.body += "## Test Results\n```\n" + request.test_results.value_or("") + "\n```\n\n";
  draft.body += "## Confidence Score: " + std::to_string(request.confidence) + "/100\n\n";
  draft.body += "Closes " + ref + "\n";
  draft.head_branch = workflow::branch_name_for(issue);
  return draft;
}

WorkflowService::WorkflowService(Services& services, const workflow::WorkflowFlavor& flavor)
    : services_(services),
      flavor_(flavor),
      vocabulary_(flavor.states),
      priorities_(flavor.priorities),
      selector_(services.tracker, vocabulary_, priorities_),
      applier_(services.tracker, vocabulary_),
      trace_id_(core::new_trace_id(services.id_gen).value) {}

void WorkflowService::emit(const std::string& event_type, const std::string& payload,
                           const std::vector<std::string>& refs) {
  const auto appended = services_.audit_log.append({services_.id_gen.next("evt"), trace_id_,
                                                    event_type, payload,
                                                    services_.clock.now_iso8601(), refs});
  if (!appended.has_value()) {
    warnings_.push_back(event_type + ": " + appended.error());
  }
}

std::vector<storage::AuditEvent> WorkflowService::audit_trail() const {
  return services_.audit_log.query(trace_id_);
}

std::vector<std::string> WorkflowService::resolve_states(
    const std::optional<std::vector<std::string>>& states) const {
  if (states.has_value() && !states->empty()) {
    return states.value();
  }
  return flavor_.pickup_states;
}

core::Result<domain::Issue, core::WorkflowError> WorkflowService::fetch_issue(
    const core::IssueId& id) {
  auto fetched = services_.tracker.get_issue(id);
  if (!fetched.has_value()) {
    return core::Result<domain::Issue, core::WorkflowError>::err(backend_failure(fetched.error()));
  }
  return core::Result<domain::Issue, core::WorkflowError>::ok(fetched.value());
}

core::Result<workflow::TransitionReceipt, core::WorkflowError> WorkflowService::apply_move(
    const domain::Issue& issue, const std::string& target) {
  auto applied = applier_.apply(issue, target);
  if (!applied.has_value()) {
    const auto& error = applied.error();
    emit(storage::event_type::kTransitionRejected,
         nlohmann::json{{"issue_id", issue.id.value},
                        {"from", issue.current_state},
                        {"requested", target},
                        {"reason", kind_to_string(error.kind)},
                        {"message", error.message}}
             .dump(),
         {issue.id.value});
    return applied;
  }

  const auto& receipt = applied.value();
  emit(storage::event_type::kTransitionApplied,
       nlohmann::json{{"issue_id", receipt.issue_id.value},
                      {"from", receipt.from_state},
                      {"to", receipt.to_state},
                      {"native_state_id", receipt.native_state.id},
                      {"native_state_name", receipt.native_state.name}}
           .dump(),
       {receipt.issue_id.value});
  return applied;
}

// ────────────────────────────────────────────────────────────────
// Reads
// ────────────────────────────────────────────────────────────────

core::Result<std::vector<domain::Issue>, core::WorkflowError> WorkflowService::list_issues(
    const std::optional<std::string>& status, const std::optional<std::string>& scope,
    const int limit) {
  tracker::IssueFilter filter;
  filter.scope = scope;
  filter.limit = limit;
  if (status.has_value()) {
    const auto canonical = vocabulary_.normalize(status.value());
    if (canonical.has_value()) {
      auto catalog = services_.tracker.list_workflow_states();
      if (!catalog.has_value()) {
        return core::Result<std::vector<domain::Issue>, core::WorkflowError>::err(
            backend_failure(catalog.error()));
      }
      filter.states = vocabulary_.backend_names_for(canonical.value(), catalog.value());
    } else {
      filter.states = {status.value()};
    }
  }

  auto listed = services_.tracker.list_issues(filter);
  if (!listed.has_value()) {
    return core::Result<std::vector<domain::Issue>, core::WorkflowError>::err(
        backend_failure(listed.error()));
  }

  std::vector<domain::Issue> issues = listed.value();
  priorities_.sort(issues);
  return core::Result<std::vector<domain::Issue>, core::WorkflowError>::ok(std::move(issues));
}

core::Result<std::vector<workflow::PickupCandidate>, core::WorkflowError> WorkflowService::queue(
    const std::optional<std::vector<std::string>>& states,
    const std::optional<std::string>& scope) {
  return selector_.rank_candidates(resolve_states(states), scope);
}

core::Result<std::optional<workflow::PickupCandidate>, core::WorkflowError>
WorkflowService::pickup(const std::optional<std::vector<std::string>>& states,
                        const std::optional<std::string>& scope) {
  const auto eligible = resolve_states(states);
  auto picked = selector_.pickup(eligible, scope);
  if (!picked.has_value()) {
    return picked;
  }

  if (!picked.value().has_value()) {
    emit(storage::event_type::kPickupEmpty,
         nlohmann::json{{"states", eligible}, {"scope", scope.value_or("")}}.dump(), {});
    return picked;
  }

  const auto& candidate = picked.value().value();
  emit(storage::event_type::kPickupSelected,
       nlohmann::json{{"issue_id", candidate.issue.id.value},
                      {"found_in_state", candidate.found_in_state},
                      {"rank", candidate.rank},
                      {"scope", scope.value_or("")}}
           .dump(),
       {candidate.issue.id.value});
  return picked;
}

core::Result<domain::Issue, core::WorkflowError> WorkflowService::show(const core::IssueId& id) {
  return fetch_issue(id);
}

core::Result<workflow::StatusReport, core::WorkflowError> WorkflowService::report(
    const std::optional<std::string>& scope) {
  tracker::IssueFilter filter;
  filter.scope = scope;
  filter.include_closed = true;

  auto listed = services_.tracker.list_issues(filter);
  if (!listed.has_value()) {
    return core::Result<workflow::StatusReport, core::WorkflowError>::err(
        backend_failure(listed.error()));
  }
  return core::Result<workflow::StatusReport, core::WorkflowError>::ok(
      workflow::build_status_report(listed.value(), vocabulary_, priorities_, scope));
}

core::Result<WorkflowCatalog, core::WorkflowError> WorkflowService::workflow_catalog() {
  auto native = services_.tracker.list_workflow_states();
  if (!native.has_value()) {
    return core::Result<WorkflowCatalog, core::WorkflowError>::err(
        backend_failure(native.error()));
  }

  std::vector<std::string> names;
  names.reserve(native.value().size());
  for (const auto& state : native.value()) {
    names.push_back(state.name);
  }

  return core::Result<WorkflowCatalog, core::WorkflowError>::ok(
      WorkflowCatalog{.canonical = vocabulary_.states(),
                      .backend = native.value(),
                      .check = vocabulary_.check_catalog(names)});
}

// ────────────────────────────────────────────────────────────────
// Mutations
// ────────────────────────────────────────────────────────────────

core::Result<std::optional<ClaimedPickup>, core::WorkflowError> WorkflowService::pickup_and_claim(
    const std::optional<std::vector<std::string>>& states,
    const std::optional<std::string>& scope, const core::WorkerId& worker,
    const std::chrono::seconds ttl) {
  using ResultT = core::Result<std::optional<ClaimedPickup>, core::WorkflowError>;

  const auto eligible = resolve_states(states);
  auto ranked = selector_.rank_candidates(eligible, scope);
  if (!ranked.has_value()) {
    return ResultT::err(ranked.error());
  }

  std::vector<std::string> skipped;
  for (const auto& candidate : ranked.value()) {
    const std::string& issue_id = candidate.issue.id.value;

    bool registered = false;
    if (services_.claims != nullptr) {
      const auto claim = services_.claims->try_claim(candidate.issue.id, worker, ttl);
      if (claim.outcome == coordination::ClaimOutcome::kBackendError) {
        return ResultT::err(backend_failure(core::BackendError{claim.error_message}));
      }
      if (claim.outcome == coordination::ClaimOutcome::kHeldByOther) {
        emit(storage::event_type::kClaimSkipped,
             nlohmann::json{{"issue_id", issue_id},
                            {"worker_id", worker.value},
                            {"holder", claim.holder}}
                 .dump(),
             {issue_id});
        skipped.push_back(issue_id);
        continue;
      }
      registered = true;
      emit(storage::event_type::kIssueClaimed,
           nlohmann::json{{"issue_id", issue_id},
                          {"worker_id", worker.value},
                          {"outcome", claim_outcome_to_string(claim.outcome)},
                          {"ttl_seconds", ttl.count()}}
               .dump(),
           {issue_id});
    }

    auto moved = apply_move(candidate.issue, flavor_.work_state);
    if (!moved.has_value()) {
      if (registered && !services_.claims->release(candidate.issue.id, worker)) {
        // The claim stays until its TTL expires.
        warnings_.push_back("claim release failed for " + issue_id);
      }
      return ResultT::err(moved.error());
    }

    emit(storage::event_type::kPickupSelected,
         nlohmann::json{{"issue_id", issue_id},
                        {"found_in_state", candidate.found_in_state},
                        {"rank", candidate.rank},
                        {"scope", scope.value_or("")},
                        {"claimed_by", worker.value}}
             .dump(),
         {issue_id});

    return ResultT::ok(ClaimedPickup{.candidate = candidate,
                                     .receipt = moved.value(),
                                     .claim_registered = registered,
                                     .skipped = skipped});
  }

  emit(storage::event_type::kPickupEmpty,
       nlohmann::json{{"states", eligible},
                      {"scope", scope.value_or("")},
                      {"skipped", skipped}}
           .dump(),
       {});
  return ResultT::ok(std::nullopt);
}

core::Result<domain::Issue, core::WorkflowError> WorkflowService::comment(
    const core::IssueId& id, const std::string& body) {
  auto fetched = fetch_issue(id);
  if (!fetched.has_value()) {
    return fetched;
  }

  auto posted = services_.tracker.post_comment(fetched.value(), body);
  if (!posted.has_value()) {
    return core::Result<domain::Issue, core::WorkflowError>::err(backend_failure(posted.error()));
  }

  emit(storage::event_type::kCommentPosted,
       nlohmann::json{{"issue_id", id.value}, {"length", body.size()}}.dump(), {id.value});
  return fetched;
}

core::Result<workflow::TransitionReceipt, core::WorkflowError> WorkflowService::move(
    const core::IssueId& id, const std::string& target) {
  auto fetched = fetch_issue(id);
  if (!fetched.has_value()) {
    return core::Result<workflow::TransitionReceipt, core::WorkflowError>::err(fetched.error());
  }
  return apply_move(fetched.value(), target);
}

core::Result<CompletionResult, core::WorkflowError> WorkflowService::complete(
    const CompletionRequest& request) {
  using ResultT = core::Result<CompletionResult, core::WorkflowError>;

  auto fetched = fetch_issue(request.issue_id);
  if (!fetched.has_value()) {
    return ResultT::err(fetched.error());
  }
  const domain::Issue& issue = fetched.value();

  auto validated = applier_.validate(issue, flavor_.review_state);
  if (!validated.has_value()) {
    emit(storage::event_type::kTransitionRejected,
         nlohmann::json{{"issue_id", issue.id.value},
                        {"from", issue.current_state},
                        {"requested", flavor_.review_state},
                        {"reason", kind_to_string(validated.error().kind)},
                        {"message", validated.error().message}}
             .dump(),
         {issue.id.value});
    return ResultT::err(validated.error());
  }

  std::optional<std::string> pull_request;
  if (services_.pull_requests != nullptr) {
    const auto draft = format_pull_request(flavor_, issue, request);
    auto created = services_.pull_requests->create_pull_request(draft);
    if (created.has_value()) {
      pull_request = created.value().url;
      emit(storage::event_type::kPullRequestCreated,
           nlohmann::json{{"issue_id", issue.id.value},
                          {"url", created.value().url},
                          {"number", created.value().number},
                          {"branch", draft.head_branch}}
               .dump(),
           {issue.id.value});
    } else {
      pull_request = kPullRequestFailed;
      warnings_.push_back("pull request for " + flavor_.issue_ref_prefix + issue.id.value +
                          " not created: " + created.error().message);
    }
  }

  const std::string body = format_completion_comment(flavor_, issue, request, pull_request);
  auto posted = services_.tracker.post_comment(issue, body);
  if (!posted.has_value()) {
    return ResultT::err(backend_failure(posted.error()));
  }
  emit(storage::event_type::kCommentPosted,
       nlohmann::json{{"issue_id", issue.id.value},
                      {"length", body.size()},
                      {"completion", true},
                      {"confidence", request.confidence}}
           .dump(),
       {issue.id.value});

  auto moved = apply_move(issue, flavor_.review_state);
  if (!moved.has_value()) {
    return ResultT::err(moved.error());
  }

  return ResultT::ok(CompletionResult{.issue = issue,
                                      .branch = workflow::branch_name_for(issue),
                                      .comment_body = body,
                                      .receipt = moved.value(),
                                      .pull_request = pull_request});
}

}  // namespace devflow::app
