#include "devflow/tracker/github_tracker.h"

#include "devflow/core/normalization.h"

#include <charconv>
#include <optional>
#include <set>
#include <string_view>
#include <system_error>
#include <utility>

namespace devflow::tracker {

using json = nlohmann::json;

namespace {

constexpr int kPageSize = 100;

constexpr const char* kIssueFields = R"(
        id
        number
        title
        state
        createdAt
        url
        labels(first: 20) { nodes { name } }
        milestone { title }
        assignees(first: 5) { nodes { login } }
        projectItems(first: 10) {
          nodes {
            id
            project { id number }
            fieldValueByName(name: "Status") {
              ... on ProjectV2ItemFieldSingleSelectValue { name optionId }
            }
          }
        })";

const std::string kListIssuesQuery = std::string(R"(
query($owner: String!, $name: String!, $states: [IssueState!], $first: Int!, $after: String) {
  repository(owner: $owner, name: $name) {
    issues(first: $first, after: $after, states: $states,
           orderBy: {field: CREATED_AT, direction: ASC}) {
      pageInfo { hasNextPage endCursor }
      nodes {)") + kIssueFields + R"(
      }
    }
  }
})";

const std::string kGetIssueQuery = std::string(R"(
query($owner: String!, $name: String!, $number: Int!) {
  repository(owner: $owner, name: $name) {
    issue(number: $number) {)") + kIssueFields + R"(
      body
      comments(first: 100) { nodes { author { login } body createdAt } }
    }
  }
})";

constexpr const char* kProjectItemsQuery = R"(
query($owner: String!, $name: String!, $number: Int!) {
  repository(owner: $owner, name: $name) {
    issue(number: $number) {
      id
      projectItems(first: 20) { nodes { id project { id } } }
    }
  }
})";

constexpr const char* kBoardFields = R"(
      id
      number
      title
      field(name: "Status") {
        ... on ProjectV2SingleSelectField { id options { id name } }
      })";

const std::string kBoardByNumberQuery = std::string(R"(
query($owner: String!, $name: String!, $number: Int!) {
  repository(owner: $owner, name: $name) {
    projectV2(number: $number) {)") + kBoardFields + R"(
    }
  }
})";

const std::string kFirstBoardQuery = std::string(R"(
query($owner: String!, $name: String!) {
  repository(owner: $owner, name: $name) {
    projectsV2(first: 1) {
      nodes {)") + kBoardFields + R"(
      }
    }
  }
})";

constexpr const char* kAddCommentMutation = R"(
mutation($subjectId: ID!, $body: String!) {
  addComment(input: {subjectId: $subjectId, body: $body}) {
    commentEdge { node { id } }
  }
})";

constexpr const char* kAddItemMutation = R"(
mutation($projectId: ID!, $contentId: ID!) {
  addProjectV2ItemById(input: {projectId: $projectId, contentId: $contentId}) {
    item { id }
  }
})";

constexpr const char* kSetStatusMutation = R"(
mutation($projectId: ID!, $itemId: ID!, $fieldId: ID!, $optionId: String!) {
  updateProjectV2ItemFieldValue(input: {
    projectId: $projectId
    itemId: $itemId
    fieldId: $fieldId
    value: { singleSelectOptionId: $optionId }
  }) {
    projectV2Item { id }
  }
})";

constexpr const char* kRepositoryQuery = R"(
query($owner: String!, $name: String!) {
  repository(owner: $owner, name: $name) {
    id
    defaultBranchRef { name }
  }
})";

constexpr const char* kCreatePullRequestMutation = R"(
mutation($input: CreatePullRequestInput!) {
  createPullRequest(input: $input) {
    pullRequest { url number }
  }
})";

std::optional<int> parse_issue_number(const std::string& text) {
  std::string_view digits = text;
  if (!digits.empty() && digits.front() == '#') {
    digits.remove_prefix(1);
  }
  int number = 0;
  const auto* first = digits.data();
  const auto* last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, number);
  if (digits.empty() || ec != std::errc() || ptr != last || number <= 0) {
    return std::nullopt;
  }
  return number;
}

core::BackendError invalid_number(const core::IssueId& id) {
  return core::BackendError{"Invalid issue number '" + id.value + "'"};
}

std::optional<ProjectBoard> parse_board(const json& node) {
  if (!node.is_object() || !node.contains("id")) {
    return std::nullopt;
  }
  ProjectBoard board;
  board.project_id = json_string(node, "id");
  board.number = node.value("number", 0);
  board.title = json_string(node, "title");
  const json& field = json_object(node, "field");
  board.status_field_id = json_string(field, "id");
  if (field.contains("options") && field["options"].is_array()) {
    for (const auto& option : field["options"]) {
      board.columns.push_back(domain::BackendState{json_string(option, "id"), json_string(option, "name")});
    }
  }
  return board;
}

}  // namespace

GitHubTracker::GitHubTracker(IHttpClient& http, GitHubSession& session)
    : session_(session), graphql_(http, kGitHubGraphQLEndpoint, session.authorization()) {}

domain::Issue GitHubTracker::parse_issue(const json& node) const {
  domain::Issue issue;
  issue.id = core::IssueId{std::to_string(node.value("number", 0))};
  issue.node_id = json_string(node, "id");
  issue.title = json_string(node, "title");
  issue.created_at = json_string(node, "createdAt");
  issue.url = json_string(node, "url");
  issue.body = json_string(node, "body");

  for (const auto& label : json_nodes(node, "labels")) {
    issue.labels.push_back(json_string(label, "name"));
  }

  const json& milestone = json_object(node, "milestone");
  if (milestone.contains("title")) {
    issue.scope = json_string(milestone, "title");
  }

  const json& assignees = json_nodes(node, "assignees");
  if (!assignees.empty()) {
    issue.assignee = json_string(assignees.front(), "login");
  }

  // Status from the session's project when one is pinned, otherwise the first
  // project item that has a Status value.
  for (const auto& item : json_nodes(node, "projectItems")) {
    const std::string status = json_string(json_object(item, "fieldValueByName"), "name");
    if (status.empty()) {
      continue;
    }
    if (session_.project_number().has_value() &&
        json_object(item, "project").value("number", 0) != session_.project_number().value()) {
      continue;
    }
    issue.current_state = status;
    break;
  }

  for (const auto& comment : json_nodes(node, "comments")) {
    issue.comments.push_back(domain::IssueComment{
        json_string(json_object(comment, "author"), "login"),
        json_string(comment, "body"),
        json_string(comment, "createdAt"),
    });
  }
  return issue;
}

core::Result<std::vector<domain::Issue>, core::BackendError> GitHubTracker::list_issues(
    const IssueFilter& filter) {
  using ListResult = core::Result<std::vector<domain::Issue>, core::BackendError>;

  std::set<std::string> state_keys;
  for (const auto& state : filter.states) {
    state_keys.insert(core::fold_state_key(state));
  }

  json variables = {
      {"owner", session_.repo().owner},
      {"name", session_.repo().name},
      {"states", filter.include_closed ? json::array({"OPEN", "CLOSED"}) : json::array({"OPEN"})},
      {"first", kPageSize},
      {"after", nullptr},
  };

  std::vector<domain::Issue> out;
  for (;;) {
    auto data = graphql_.execute(kListIssuesQuery, variables);
    if (!data.has_value()) {
      return ListResult::err(data.error());
    }
    const json& repository = json_object(data.value(), "repository");
    if (repository.empty()) {
      return ListResult::err(core::BackendError{"Repository " + session_.repo().owner + "/" +
                                                session_.repo().name + " not found"});
    }
    const json& issues = json_object(repository, "issues");

    for (const auto& node : json_nodes(repository, "issues")) {
      domain::Issue issue = parse_issue(node);
      if (!state_keys.empty() && state_keys.count(core::fold_state_key(issue.current_state)) == 0) {
        continue;
      }
      if (filter.scope.has_value() && issue.scope != filter.scope) {
        continue;
      }
      out.push_back(std::move(issue));
      if (filter.limit > 0 && static_cast<int>(out.size()) >= filter.limit) {
        return ListResult::ok(std::move(out));
      }
    }

    const json& page_info = json_object(issues, "pageInfo");
    const std::string cursor = json_string(page_info, "endCursor");
    if (!page_info.value("hasNextPage", false) || cursor.empty()) {
      break;
    }
    variables["after"] = cursor;
  }
  return ListResult::ok(std::move(out));
}

core::Result<domain::Issue, core::BackendError> GitHubTracker::get_issue(const core::IssueId& id) {
  using GetResult = core::Result<domain::Issue, core::BackendError>;

  const auto number = parse_issue_number(id.value);
  if (!number.has_value()) {
    return GetResult::err(invalid_number(id));
  }

  auto data = graphql_.execute(kGetIssueQuery, {{"owner", session_.repo().owner},
                                                {"name", session_.repo().name},
                                                {"number", number.value()}});
  if (!data.has_value()) {
    return GetResult::err(data.error());
  }
  const json& node = json_object(json_object(data.value(), "repository"), "issue");
  if (node.empty()) {
    return GetResult::err(core::BackendError{"Issue #" + std::to_string(number.value()) + " not found"});
  }
  return GetResult::ok(parse_issue(node));
}

core::Result<bool, core::BackendError> GitHubTracker::post_comment(const domain::Issue& issue,
                                                                   const std::string& body) {
  using CommentResult = core::Result<bool, core::BackendError>;

  std::string subject_id = issue.node_id;
  if (subject_id.empty()) {
    auto fresh = get_issue(issue.id);
    if (!fresh.has_value()) {
      return CommentResult::err(fresh.error());
    }
    subject_id = fresh.value().node_id;
  }

  auto data = graphql_.execute(kAddCommentMutation, {{"subjectId", subject_id}, {"body", body}});
  if (!data.has_value()) {
    return CommentResult::err(data.error());
  }
  return CommentResult::ok(true);
}

core::Result<PullRequest, core::BackendError> GitHubTracker::create_pull_request(
    const PullRequestDraft& draft) {
  using PullResult = core::Result<PullRequest, core::BackendError>;
  const std::string repo_name = session_.repo().owner + "/" + session_.repo().name;

  auto repo = graphql_.execute(kRepositoryQuery,
                               {{"owner", session_.repo().owner}, {"name", session_.repo().name}});
  if (!repo.has_value()) {
    return PullResult::err(repo.error());
  }
  const json& repository = json_object(repo.value(), "repository");
  if (repository.empty()) {
    return PullResult::err(core::BackendError{"Repository " + repo_name + " not found"});
  }
  const std::string base = json_string(json_object(repository, "defaultBranchRef"), "name");
  if (base.empty()) {
    return PullResult::err(
        core::BackendError{"Repository " + repo_name + " has no default branch"});
  }

  const json input = {
      {"repositoryId", json_string(repository, "id")},
      {"baseRefName", base},
      {"headRefName", draft.head_branch},
      {"title", draft.title},
      {"body", draft.body},
  };
  auto data = graphql_.execute(kCreatePullRequestMutation, {{"input", input}});
  if (!data.has_value()) {
    return PullResult::err(data.error());
  }
  const json& node = json_object(json_object(data.value(), "createPullRequest"), "pullRequest");
  PullRequest created{json_string(node, "url"), 0};
  if (node.contains("number") && node["number"].is_number_integer()) {
    created.number = node["number"].get<int>();
  }
  if (created.url.empty()) {
    return PullResult::err(
        core::BackendError{"createPullRequest returned no pull request for " + draft.head_branch});
  }
  return PullResult::ok(std::move(created));
}

core::Result<ProjectBoard, core::BackendError> GitHubTracker::board() {
  using BoardResult = core::Result<ProjectBoard, core::BackendError>;

  if (session_.board().has_value()) {
    return BoardResult::ok(session_.board().value());
  }

  const std::string repo_name = session_.repo().owner + "/" + session_.repo().name;
  std::optional<ProjectBoard> board;

  if (session_.project_number().has_value()) {
    auto data = graphql_.execute(kBoardByNumberQuery, {{"owner", session_.repo().owner},
                                                       {"name", session_.repo().name},
                                                       {"number", session_.project_number().value()}});
    if (!data.has_value()) {
      return BoardResult::err(data.error());
    }
    board = parse_board(json_object(json_object(data.value(), "repository"), "projectV2"));
    if (!board.has_value()) {
      return BoardResult::err(core::BackendError{
          "Project #" + std::to_string(session_.project_number().value()) + " not found for " +
          repo_name});
    }
  } else {
    auto data = graphql_.execute(kFirstBoardQuery,
                                 {{"owner", session_.repo().owner}, {"name", session_.repo().name}});
    if (!data.has_value()) {
      return BoardResult::err(data.error());
    }
    const json& projects = json_nodes(json_object(data.value(), "repository"), "projectsV2");
    if (!projects.empty()) {
      board = parse_board(projects.front());
    }
    if (!board.has_value()) {
      return BoardResult::err(core::BackendError{"No project found for " + repo_name});
    }
  }

  if (board->status_field_id.empty()) {
    return BoardResult::err(
        core::BackendError{"Status field not found in project '" + board->title + "'"});
  }

  session_.cache_board(board.value());
  return BoardResult::ok(std::move(board.value()));
}

core::Result<bool, core::BackendError> GitHubTracker::set_state(const domain::Issue& issue,
                                                                const domain::BackendState& target) {
  using SetResult = core::Result<bool, core::BackendError>;

  const auto number = parse_issue_number(issue.id.value);
  if (!number.has_value()) {
    return SetResult::err(invalid_number(issue.id));
  }

  auto project = board();
  if (!project.has_value()) {
    return SetResult::err(project.error());
  }
  const ProjectBoard& current = project.value();

  auto items = graphql_.execute(kProjectItemsQuery, {{"owner", session_.repo().owner},
                                                     {"name", session_.repo().name},
                                                     {"number", number.value()}});
  if (!items.has_value()) {
    return SetResult::err(items.error());
  }
  const json& node = json_object(json_object(items.value(), "repository"), "issue");
  if (node.empty()) {
    return SetResult::err(core::BackendError{"Issue #" + std::to_string(number.value()) + " not found"});
  }

  std::string item_id;
  for (const auto& item : json_nodes(node, "projectItems")) {
    if (json_string(json_object(item, "project"), "id") == current.project_id) {
      item_id = json_string(item, "id");
      break;
    }
  }

  if (item_id.empty()) {
    auto added = graphql_.execute(kAddItemMutation, {{"projectId", current.project_id},
                                                     {"contentId", json_string(node, "id")}});
    if (!added.has_value()) {
      return SetResult::err(added.error());
    }
    item_id = json_string(json_object(json_object(added.value(), "addProjectV2ItemById"), "item"), "id");
    if (item_id.empty()) {
      return SetResult::err(core::BackendError{"Could not add issue #" +
                                               std::to_string(number.value()) + " to project '" +
                                               current.title + "'"});
    }
  }

  auto updated = graphql_.execute(kSetStatusMutation, {{"projectId", current.project_id},
                                                       {"itemId", item_id},
                                                       {"fieldId", current.status_field_id},
                                                       {"optionId", target.id}});
  if (!updated.has_value()) {
    return SetResult::err(updated.error());
  }
  return SetResult::ok(true);
}

core::Result<std::vector<domain::BackendState>, core::BackendError>
GitHubTracker::list_workflow_states() {
  using StatesResult = core::Result<std::vector<domain::BackendState>, core::BackendError>;
  auto project = board();
  if (!project.has_value()) {
    return StatesResult::err(project.error());
  }
  return StatesResult::ok(project.value().columns);
}

}  // namespace devflow::tracker
