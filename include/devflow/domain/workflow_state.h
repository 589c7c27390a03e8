#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace devflow::domain {

// Ownership documents who is expected to act on an issue in a state.
// It is informational only: nothing in the engine enforces it.
enum class Ownership {
  kHuman,
  kHumanToAgent,
  kAgent,
  kArchive,
};

[[nodiscard]] std::string_view ownership_to_string(Ownership ownership);

// WorkflowState is one entry of a flavor's closed, ordered state catalog.
// order is the position in the catalog and defines forward vs backward moves.
struct WorkflowState {
  std::string canonical_name;
  Ownership ownership{Ownership::kHuman};
  std::size_t order{0};
  std::string description;

  bool operator==(const WorkflowState&) const = default;
};

// BackendState is a state as a backend knows it: a Linear workflow state or a
// Projects V2 "Status" option. id is what the backend mutation expects.
struct BackendState {
  std::string id;
  std::string name;
};

}  // namespace devflow::domain
