#pragma once

#include "devflow/core/ids.h"

#include <optional>
#include <string>
#include <vector>

namespace devflow::domain {

struct IssueComment {
  std::string author;
  std::string body;
  std::string created_at;
};

// Issue is an external record: the backend creates and mutates it, devflow
// only reads a fresh copy per invocation and never stores it.
struct Issue {
  core::IssueId id;
  std::string node_id;        // backend-internal id used by mutations; may be empty
  std::string title;
  std::string current_state;  // raw backend state name; empty means "no status"

  // Priority, in whichever representation the backend uses:
  // board labels such as "P: HIGH", or a Linear priority code 0..4.
  std::vector<std::string> labels;
  std::optional<int> priority_code;
  std::string priority_label;  // display text reported by the backend

  std::string created_at;  // ISO 8601; ordering tie-break only

  std::optional<std::string> scope;  // milestone (board) or project (linear)
  std::string url;
  std::optional<std::string> assignee;

  // Populated by detail reads (get_issue) only.
  std::string body;
  std::vector<IssueComment> comments;
};

}  // namespace devflow::domain
