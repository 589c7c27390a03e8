#include "devflow/tracker/linear_tracker.h"

#include "devflow/core/normalization.h"

#include <algorithm>
#include <utility>

namespace devflow::tracker {

using json = nlohmann::json;

namespace {

constexpr const char* kTeamsQuery = R"(
query {
  teams {
    nodes { id key name }
  }
})";

constexpr const char* kWorkflowStatesQuery = R"(
query($teamId: ID!) {
  workflowStates(filter: { team: { id: { eq: $teamId } } }) {
    nodes { id name type position }
  }
})";

constexpr int kPageSize = 50;

constexpr const char* kListIssuesQuery = R"(
query($filter: IssueFilter, $first: Int!, $after: String) {
  issues(filter: $filter, first: $first, after: $after) {
    pageInfo { hasNextPage endCursor }
    nodes {
      id
      identifier
      title
      priority
      priorityLabel
      createdAt
      url
      state { id name type }
      assignee { name }
      labels { nodes { name } }
      project { name }
    }
  }
})";

constexpr const char* kGetIssueQuery = R"(
query($id: String!) {
  issue(id: $id) {
    id
    identifier
    title
    description
    priority
    priorityLabel
    createdAt
    url
    state { id name type }
    assignee { name }
    labels { nodes { name } }
    project { name }
    comments { nodes { body createdAt user { name } } }
  }
})";

constexpr const char* kCommentCreateMutation = R"(
mutation($issueId: String!, $body: String!) {
  commentCreate(input: { issueId: $issueId, body: $body }) {
    success
  }
})";

constexpr const char* kIssueUpdateMutation = R"(
mutation($issueId: String!, $stateId: String!) {
  issueUpdate(id: $issueId, input: { stateId: $stateId }) {
    success
  }
})";

domain::Issue parse_issue(const json& node) {
  domain::Issue issue;
  issue.id = core::IssueId{json_string(node, "identifier")};
  issue.node_id = json_string(node, "id");
  issue.title = json_string(node, "title");
  issue.current_state = json_string(json_object(node, "state"), "name");
  if (node.contains("priority") && node["priority"].is_number_integer()) {
    issue.priority_code = node["priority"].get<int>();
  }
  issue.priority_label = json_string(node, "priorityLabel");
  issue.created_at = json_string(node, "createdAt");
  issue.url = json_string(node, "url");
  issue.body = json_string(node, "description");

  const json& assignee = json_object(node, "assignee");
  if (assignee.contains("name")) {
    issue.assignee = json_string(assignee, "name");
  }
  const json& project = json_object(node, "project");
  if (project.contains("name")) {
    issue.scope = json_string(project, "name");
  }
  for (const auto& label : json_nodes(node, "labels")) {
    issue.labels.push_back(json_string(label, "name"));
  }
  for (const auto& comment : json_nodes(node, "comments")) {
    issue.comments.push_back(domain::IssueComment{
        json_string(json_object(comment, "user"), "name"),
        json_string(comment, "body"),
        json_string(comment, "createdAt"),
    });
  }
  return issue;
}

}  // namespace

LinearTracker::LinearTracker(IHttpClient& http, LinearSession& session)
    : session_(session),
      graphql_(http, kLinearGraphQLEndpoint, session.credentials().authorization()) {}

core::Result<LinearTeam, core::BackendError> LinearTracker::team() {
  using TeamResult = core::Result<LinearTeam, core::BackendError>;

  if (session_.team().has_value()) {
    return TeamResult::ok(session_.team().value());
  }

  auto data = graphql_.execute(kTeamsQuery);
  if (!data.has_value()) {
    return TeamResult::err(data.error());
  }

  std::vector<LinearTeam> teams;
  for (const auto& node : json_nodes(data.value(), "teams")) {
    teams.push_back(LinearTeam{json_string(node, "id"), json_string(node, "key"), json_string(node, "name")});
  }
  if (teams.empty()) {
    return TeamResult::err(core::BackendError{"No teams found"});
  }

  const auto& wanted = session_.team_key();
  if (!wanted.has_value()) {
    session_.cache_team(teams.front());
    return TeamResult::ok(teams.front());
  }

  const std::string wanted_key = core::normalize_ascii_lower(wanted.value());
  std::string available;
  for (const auto& team : teams) {
    if (core::normalize_ascii_lower(team.key) == wanted_key) {
      session_.cache_team(team);
      return TeamResult::ok(team);
    }
    available += available.empty() ? team.key : ", " + team.key;
  }
  return TeamResult::err(
      core::BackendError{"Team '" + wanted.value() + "' not found. Available: " + available});
}

core::Result<std::vector<domain::Issue>, core::BackendError> LinearTracker::list_issues(
    const IssueFilter& filter) {
  using ListResult = core::Result<std::vector<domain::Issue>, core::BackendError>;

  auto current_team = team();
  if (!current_team.has_value()) {
    return ListResult::err(current_team.error());
  }

  json issue_filter = {{"team", {{"id", {{"eq", current_team.value().id}}}}}};
  if (filter.states.size() == 1) {
    issue_filter["state"] = {{"name", {{"eqIgnoreCase", filter.states.front()}}}};
  } else if (!filter.states.empty()) {
    issue_filter["state"] = {{"name", {{"in", filter.states}}}};
  } else if (!filter.include_closed) {
    issue_filter["state"] = {{"type", {{"nin", json::array({"completed", "canceled"})}}}};
  }
  if (filter.scope.has_value()) {
    issue_filter["project"] = {{"name", {{"eq", filter.scope.value()}}}};
  }

  json variables = {
      {"filter", issue_filter},
      {"first", filter.limit > 0 && filter.limit < kPageSize ? filter.limit : kPageSize},
      {"after", nullptr},
  };

  std::vector<domain::Issue> out;
  for (;;) {
    auto data = graphql_.execute(kListIssuesQuery, variables);
    if (!data.has_value()) {
      return ListResult::err(data.error());
    }
    for (const auto& node : json_nodes(data.value(), "issues")) {
      out.push_back(parse_issue(node));
      if (filter.limit > 0 && static_cast<int>(out.size()) >= filter.limit) {
        return ListResult::ok(std::move(out));
      }
    }

    const json& page_info = json_object(json_object(data.value(), "issues"), "pageInfo");
    const std::string cursor = json_string(page_info, "endCursor");
    if (!page_info.value("hasNextPage", false) || cursor.empty()) {
      break;
    }
    variables["after"] = cursor;
  }
  return ListResult::ok(std::move(out));
}

core::Result<domain::Issue, core::BackendError> LinearTracker::get_issue(const core::IssueId& id) {
  using GetResult = core::Result<domain::Issue, core::BackendError>;

  auto data = graphql_.execute(kGetIssueQuery, {{"id", id.value}});
  if (!data.has_value()) {
    return GetResult::err(data.error());
  }
  const json& node = json_object(data.value(), "issue");
  if (node.empty()) {
    return GetResult::err(core::BackendError{"Issue " + id.value + " not found"});
  }
  return GetResult::ok(parse_issue(node));
}

core::Result<std::string, core::BackendError> LinearTracker::node_id_for(const domain::Issue& issue) {
  using IdResult = core::Result<std::string, core::BackendError>;
  if (!issue.node_id.empty()) {
    return IdResult::ok(issue.node_id);
  }
  auto fresh = get_issue(issue.id);
  if (!fresh.has_value()) {
    return IdResult::err(fresh.error());
  }
  return IdResult::ok(fresh.value().node_id);
}

core::Result<bool, core::BackendError> LinearTracker::post_comment(const domain::Issue& issue,
                                                                   const std::string& body) {
  using CommentResult = core::Result<bool, core::BackendError>;

  auto issue_id = node_id_for(issue);
  if (!issue_id.has_value()) {
    return CommentResult::err(issue_id.error());
  }
  auto data =
      graphql_.execute(kCommentCreateMutation, {{"issueId", issue_id.value()}, {"body", body}});
  if (!data.has_value()) {
    return CommentResult::err(data.error());
  }
  if (!json_object(data.value(), "commentCreate").value("success", false)) {
    return CommentResult::err(
        core::BackendError{"Failed to post comment to " + issue.id.value});
  }
  return CommentResult::ok(true);
}

core::Result<bool, core::BackendError> LinearTracker::set_state(const domain::Issue& issue,
                                                                const domain::BackendState& target) {
  using SetResult = core::Result<bool, core::BackendError>;

  auto issue_id = node_id_for(issue);
  if (!issue_id.has_value()) {
    return SetResult::err(issue_id.error());
  }
  auto data =
      graphql_.execute(kIssueUpdateMutation, {{"issueId", issue_id.value()}, {"stateId", target.id}});
  if (!data.has_value()) {
    return SetResult::err(data.error());
  }
  if (!json_object(data.value(), "issueUpdate").value("success", false)) {
    return SetResult::err(core::BackendError{"Failed to move " + issue.id.value + " to '" +
                                             target.name + "'"});
  }
  return SetResult::ok(true);
}

core::Result<std::vector<domain::BackendState>, core::BackendError>
LinearTracker::list_workflow_states() {
  using StatesResult = core::Result<std::vector<domain::BackendState>, core::BackendError>;

  if (session_.states().has_value()) {
    return StatesResult::ok(session_.states().value());
  }

  auto current_team = team();
  if (!current_team.has_value()) {
    return StatesResult::err(current_team.error());
  }
  auto data = graphql_.execute(kWorkflowStatesQuery, {{"teamId", current_team.value().id}});
  if (!data.has_value()) {
    return StatesResult::err(data.error());
  }

  struct Positioned {
    double position;
    domain::BackendState state;
  };
  std::vector<Positioned> positioned;
  for (const auto& node : json_nodes(data.value(), "workflowStates")) {
    const double position = node.contains("position") && node["position"].is_number()
                                ? node["position"].get<double>()
                                : 0.0;
    positioned.push_back(Positioned{position, {json_string(node, "id"), json_string(node, "name")}});
  }
  std::stable_sort(positioned.begin(), positioned.end(),
                   [](const Positioned& a, const Positioned& b) { return a.position < b.position; });

  std::vector<domain::BackendState> states;
  states.reserve(positioned.size());
  for (auto& entry : positioned) {
    states.push_back(std::move(entry.state));
  }
  session_.cache_states(states);
  return StatesResult::ok(std::move(states));
}

}  // namespace devflow::tracker
