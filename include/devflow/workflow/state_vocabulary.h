#pragma once

#include "devflow/domain/workflow_state.h"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devflow::workflow {

struct StateDefinition {
  std::string name;
  domain::Ownership ownership{domain::Ownership::kHuman};
  std::string description;
};

// StateTable is the static data a backend flavor supplies.
// states is in workflow order; aliases map alternative spellings to a
// canonical name; backward_allowed lists the only (from, to) pairs that may
// move against the order (rejection and blocker flows).
struct StateTable {
  std::vector<StateDefinition> states;
  std::vector<std::pair<std::string, std::string>> aliases;
  std::vector<std::pair<std::string, std::string>> backward_allowed;
};

// CatalogCheck compares the states a backend actually has against the
// canonical list. found and missing follow canonical order; extra keeps the
// backend's order and spelling.
struct CatalogCheck {
  bool valid{false};
  std::vector<std::string> found;
  std::vector<std::string> missing;
  std::vector<std::string> extra;
};

// StateVocabulary owns one flavor's state catalog and answers every
// state-name question the engine asks. All queries are pure.
//
// Invariants established by the constructor (std::invalid_argument otherwise):
// - canonical names are non-empty and unique after folding
// - every alias and backward pair names a canonical state
// - no folded key resolves to two different canonical states
class StateVocabulary {
 public:
  explicit StateVocabulary(const StateTable& table);

  // normalize folds raw (case, '-', '_', whitespace), tries the alias table,
  // then the canonical names. nullopt means "unrecognized".
  // normalize(normalize(x)->canonical_name) == normalize(x) for every recognised x.
  [[nodiscard]] std::optional<domain::WorkflowState> normalize(std::string_view raw) const;

  // Forward and lateral moves are valid, as are the allow-listed backward
  // pairs. Unrecognized endpoints are never valid.
  [[nodiscard]] bool is_valid_transition(std::string_view from, std::string_view to) const;
  [[nodiscard]] bool is_valid_transition(const domain::WorkflowState& from,
                                         const domain::WorkflowState& to) const;

  // Every canonical name reachable from `from` in one valid move, in workflow order.
  [[nodiscard]] std::vector<std::string> allowed_targets(const domain::WorkflowState& from) const;

  [[nodiscard]] std::vector<std::string> canonical_names() const;
  [[nodiscard]] const std::vector<domain::WorkflowState>& states() const { return states_; }

  [[nodiscard]] CatalogCheck check_catalog(const std::vector<std::string>& available) const;

  // Names a backend may store for `state`: the canonical name, then every
  // catalog entry that normalizes to it, in catalog order. Spellings that fold
  // to the same key appear once.
  [[nodiscard]] std::vector<std::string> backend_names_for(
      const domain::WorkflowState& state, const std::vector<domain::BackendState>& catalog) const;

 private:
  std::vector<domain::WorkflowState> states_;
  std::map<std::string, std::size_t> aliases_;    // folded alias -> state index
  std::map<std::string, std::size_t> canonical_;  // folded canonical name -> state index
  std::set<std::pair<std::size_t, std::size_t>> backward_allowed_;

  [[nodiscard]] std::size_t require_state(const std::string& name, const char* context) const;
};

// "a, b, c": how state lists appear in error messages.
[[nodiscard]] std::string join_state_names(const std::vector<std::string>& names);

}  // namespace devflow::workflow
