#include "devflow/tracker/github_session.h"

#include <utility>

namespace devflow::tracker {

std::optional<GitHubRepo> parse_repo_slug(const std::string_view slug) {
  const auto slash = slug.find('/');
  if (slash == std::string_view::npos || slash == 0 || slash + 1 >= slug.size()) {
    return std::nullopt;
  }
  const auto owner = slug.substr(0, slash);
  const auto name = slug.substr(slash + 1);
  if (name.find('/') != std::string_view::npos) {
    return std::nullopt;
  }
  return GitHubRepo{std::string(owner), std::string(name)};
}

std::optional<std::string> resolve_github_token(const core::EnvLookup& env) {
  if (auto token = env("GITHUB_TOKEN"); token.has_value()) {
    return token;
  }
  return env("GH_TOKEN");
}

GitHubSession::GitHubSession(std::string token, GitHubRepo repo,
                             const std::optional<int> project_number)
    : token_(std::move(token)), repo_(std::move(repo)), project_number_(project_number) {}

}  // namespace devflow::tracker
