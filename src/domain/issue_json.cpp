#include "devflow/domain/issue_json.h"

namespace devflow::domain {

nlohmann::json issue_to_json(const Issue& issue) {
  nlohmann::json j;

  j["id"] = issue.id.value;
  j["title"] = issue.title;
  j["state"] = issue.current_state;
  j["labels"] = issue.labels;
  if (issue.priority_code.has_value()) {
    j["priority"] = issue.priority_code.value();
  }
  if (!issue.priority_label.empty()) {
    j["priority_label"] = issue.priority_label;
  }
  j["created_at"] = issue.created_at;
  if (issue.scope.has_value()) {
    j["scope"] = issue.scope.value();
  }
  if (!issue.url.empty()) {
    j["url"] = issue.url;
  }
  if (issue.assignee.has_value()) {
    j["assignee"] = issue.assignee.value();
  }
  if (!issue.node_id.empty()) {
    j["node_id"] = issue.node_id;
  }
  if (!issue.body.empty()) {
    j["body"] = issue.body;
  }
  if (!issue.comments.empty()) {
    nlohmann::json comments = nlohmann::json::array();
    for (const auto& comment : issue.comments) {
      comments.push_back({{"author", comment.author},
                          {"body", comment.body},
                          {"created_at", comment.created_at}});
    }
    j["comments"] = comments;
  }

  return j;
}

Issue issue_from_json(const nlohmann::json& j) {
  Issue issue;

  // Board fixtures often carry numeric ids; keep them as their decimal text.
  const auto& id = j.at("id");
  issue.id.value = id.is_number_integer() ? std::to_string(id.get<long long>())
                                          : id.get<std::string>();

  issue.title = j.value("title", "");
  issue.current_state = j.value("state", "");
  if (j.contains("labels")) {
    issue.labels = j["labels"].get<std::vector<std::string>>();
  }
  if (j.contains("priority") && !j["priority"].is_null()) {
    issue.priority_code = j["priority"].get<int>();
  }
  issue.priority_label = j.value("priority_label", "");
  issue.created_at = j.value("created_at", "");
  if (j.contains("scope") && j["scope"].is_string()) {
    issue.scope = j["scope"].get<std::string>();
  }
  issue.url = j.value("url", "");
  if (j.contains("assignee") && j["assignee"].is_string()) {
    issue.assignee = j["assignee"].get<std::string>();
  }
  issue.node_id = j.value("node_id", "");
  issue.body = j.value("body", "");
  if (j.contains("comments")) {
    for (const auto& comment_json : j["comments"]) {
      issue.comments.push_back(IssueComment{comment_json.value("author", ""),
                                            comment_json.value("body", ""),
                                            comment_json.value("created_at", "")});
    }
  }

  return issue;
}

nlohmann::json issues_to_json(const std::vector<Issue>& issues) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& issue : issues) {
    arr.push_back(issue_to_json(issue));
  }
  return arr;
}

nlohmann::json backend_state_to_json(const BackendState& state) {
  return {{"id", state.id}, {"name", state.name}};
}

BackendState backend_state_from_json(const nlohmann::json& j) {
  BackendState state;
  state.name = j.at("name").get<std::string>();
  state.id = j.value("id", state.name);
  return state;
}

}  // namespace devflow::domain
