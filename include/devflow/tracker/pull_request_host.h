#pragma once

#include "devflow/core/result.h"

#include <string>

namespace devflow::tracker {

struct PullRequestDraft {
  std::string title;
  std::string body;
  std::string head_branch;  // merged into the repository's default branch
};

struct PullRequest {
  std::string url;
  int number{0};
};

// IPullRequestHost opens pull requests for finished work. Only backends that
// host the code implement it; complete() skips the step when none is wired.
class IPullRequestHost {
 public:
  virtual ~IPullRequestHost() = default;

  [[nodiscard]] virtual core::Result<PullRequest, core::BackendError> create_pull_request(
      const PullRequestDraft& draft) = 0;

 protected:
  IPullRequestHost() = default;
  IPullRequestHost(const IPullRequestHost&) = default;
  IPullRequestHost& operator=(const IPullRequestHost&) = default;
  IPullRequestHost(IPullRequestHost&&) = default;
  IPullRequestHost& operator=(IPullRequestHost&&) = default;
};

}  // namespace devflow::tracker
