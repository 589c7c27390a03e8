#pragma once

#include "devflow/core/env.h"
#include "devflow/domain/workflow_state.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devflow::tracker {

inline constexpr const char* kGitHubGraphQLEndpoint = "https://api.github.com/graphql";

struct GitHubRepo {
  std::string owner;
  std::string name;
};

// "owner/name" with both parts non-empty and no further '/'.
[[nodiscard]] std::optional<GitHubRepo> parse_repo_slug(std::string_view slug);

// GITHUB_TOKEN, then GH_TOKEN.
[[nodiscard]] std::optional<std::string> resolve_github_token(const core::EnvLookup& env);

// ProjectBoard is the Projects V2 board whose "Status" field holds the columns.
struct ProjectBoard {
  std::string project_id;
  int number{0};
  std::string title;
  std::string status_field_id;
  std::vector<domain::BackendState> columns;  // Status options, board order
};

// GitHubSession carries everything resolved once per process: the token, the
// repository, the optional project number, and the board once it has been
// looked up.
class GitHubSession {
 public:
  GitHubSession(std::string token, GitHubRepo repo, std::optional<int> project_number);

  [[nodiscard]] std::string authorization() const { return "Bearer " + token_; }
  [[nodiscard]] const GitHubRepo& repo() const { return repo_; }
  [[nodiscard]] std::optional<int> project_number() const { return project_number_; }

  [[nodiscard]] const std::optional<ProjectBoard>& board() const { return board_; }
  void cache_board(ProjectBoard board) { board_ = std::move(board); }

 private:
  std::string token_;
  GitHubRepo repo_;
  std::optional<int> project_number_;
  std::optional<ProjectBoard> board_;
};

}  // namespace devflow::tracker
