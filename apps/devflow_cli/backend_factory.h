#pragma once

#include "devflow/core/env.h"
#include "devflow/core/result.h"
#include "devflow/tracker/github_session.h"
#include "devflow/tracker/http_client.h"
#include "devflow/tracker/issue_tracker.h"
#include "devflow/tracker/linear_session.h"
#include "devflow/tracker/pull_request_host.h"
#include "devflow/workflow/flavor.h"

#include "config.h"
#include <memory>
#include <string>

namespace devflow::cli {

// BackendRuntime owns one tracker and everything it borrows: the HTTP
// transport and the session object. Trackers hold references into it, so it
// is handed out by shared_ptr and never copied.
struct BackendRuntime {
  std::unique_ptr<tracker::IHttpClient> http;                // NOLINT(readability-identifier-naming)
  std::unique_ptr<tracker::GitHubSession> github_session;    // NOLINT(readability-identifier-naming)
  std::unique_ptr<tracker::LinearSession> linear_session;    // NOLINT(readability-identifier-naming)
  std::unique_ptr<tracker::IIssueTracker> tracker;           // NOLINT(readability-identifier-naming)
  tracker::IPullRequestHost* pull_requests{nullptr};  // the tracker, when it hosts code; NOLINT(readability-identifier-naming)
  const workflow::WorkflowFlavor* flavor{nullptr};           // NOLINT(readability-identifier-naming)
  std::string description;                                   // NOLINT(readability-identifier-naming)
  std::string claim_namespace;  // "github:owner/repo", "linear:ASA"; NOLINT(readability-identifier-naming)
};

// Redis key prefix for claims on this backend: "devflow:claim:<namespace>:".
[[nodiscard]] std::string claim_key_prefix(const BackendRuntime& runtime);

// open_backend resolves credentials from env and constructs the tracker the
// config selects. Errors are operator-facing messages (missing token,
// unreadable fixture, curl init failure). No network request is made here.
[[nodiscard]] core::Result<std::shared_ptr<BackendRuntime>, std::string> open_backend(
    const CliConfig& config, const core::EnvLookup& env);

}  // namespace devflow::cli
