#pragma once

#include "devflow/domain/issue.h"
#include "devflow/domain/workflow_state.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace devflow::domain {

// devflow's own JSON shape for issues, used by `--format json` output and by
// fixture files. Backend wire formats are parsed inside the tracker clients.
//
// {
//   "id": "42", "title": "...", "state": "dev ready",
//   "labels": ["P: HIGH"], "priority": 2, "priority_label": "High",
//   "created_at": "2026-01-01T00:00:00Z", "scope": "Phase 1",
//   "url": "...", "assignee": "octocat", "node_id": "...",
//   "body": "...", "comments": [{"author": "...", "body": "...", "created_at": "..."}]
// }
[[nodiscard]] nlohmann::json issue_to_json(const Issue& issue);

// Throws nlohmann::json::exception when "id" is missing or a field has the wrong type.
[[nodiscard]] Issue issue_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json issues_to_json(const std::vector<Issue>& issues);

[[nodiscard]] nlohmann::json backend_state_to_json(const BackendState& state);
[[nodiscard]] BackendState backend_state_from_json(const nlohmann::json& j);

}  // namespace devflow::domain
