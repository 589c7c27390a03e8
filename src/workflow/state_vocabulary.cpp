#include "devflow/workflow/state_vocabulary.h"

#include "devflow/core/normalization.h"

#include <algorithm>
#include <stdexcept>

namespace devflow::workflow {

StateVocabulary::StateVocabulary(const StateTable& table) {
  states_.reserve(table.states.size());

  for (const auto& def : table.states) {
    const std::string key = core::fold_state_key(def.name);
    if (key.empty()) {
      throw std::invalid_argument("workflow state name must not be empty");
    }
    if (canonical_.contains(key)) {
      throw std::invalid_argument("duplicate workflow state: " + def.name);
    }
    canonical_[key] = states_.size();
    states_.push_back(domain::WorkflowState{def.name, def.ownership, states_.size(), def.description});
  }

  for (const auto& [alias, target] : table.aliases) {
    const std::size_t index = require_state(target, "alias target");
    const std::string key = core::fold_state_key(alias);

    // An alias that spells another state's canonical name would make
    // normalize() depend on lookup order.
    const auto canonical_it = canonical_.find(key);
    if (canonical_it != canonical_.end() && canonical_it->second != index) {
      throw std::invalid_argument("alias '" + alias + "' shadows workflow state '" +
                                  states_[canonical_it->second].canonical_name + "'");
    }
    const auto [it, inserted] = aliases_.emplace(key, index);
    if (!inserted && it->second != index) {
      throw std::invalid_argument("alias '" + alias + "' maps to more than one workflow state");
    }
  }

  for (const auto& [from, to] : table.backward_allowed) {
    const std::size_t from_index = require_state(from, "backward transition source");
    const std::size_t to_index = require_state(to, "backward transition target");
    backward_allowed_.emplace(from_index, to_index);
  }
}

std::size_t StateVocabulary::require_state(const std::string& name, const char* context) const {
  const auto it = canonical_.find(core::fold_state_key(name));
  if (it == canonical_.end()) {
    throw std::invalid_argument(std::string(context) + " is not a workflow state: " + name);
  }
  return it->second;
}

std::optional<domain::WorkflowState> StateVocabulary::normalize(const std::string_view raw) const {
  const std::string key = core::fold_state_key(raw);
  if (key.empty()) {
    return std::nullopt;
  }

  if (const auto it = aliases_.find(key); it != aliases_.end()) {
    return states_[it->second];
  }
  if (const auto it = canonical_.find(key); it != canonical_.end()) {
    return states_[it->second];
  }
  return std::nullopt;
}

bool StateVocabulary::is_valid_transition(const std::string_view from,
                                          const std::string_view to) const {
  const auto from_state = normalize(from);
  const auto to_state = normalize(to);
  if (!from_state.has_value() || !to_state.has_value()) {
    return false;
  }
  return is_valid_transition(from_state.value(), to_state.value());
}

bool StateVocabulary::is_valid_transition(const domain::WorkflowState& from,
                                          const domain::WorkflowState& to) const {
  if (to.order >= from.order) {
    return true;
  }
  return backward_allowed_.contains({from.order, to.order});
}

std::vector<std::string> StateVocabulary::allowed_targets(const domain::WorkflowState& from) const {
  std::vector<std::string> targets;
  for (const auto& state : states_) {
    if (is_valid_transition(from, state)) {
      targets.push_back(state.canonical_name);
    }
  }
  return targets;
}

std::vector<std::string> StateVocabulary::canonical_names() const {
  std::vector<std::string> names;
  names.reserve(states_.size());
  for (const auto& state : states_) {
    names.push_back(state.canonical_name);
  }
  return names;
}

CatalogCheck StateVocabulary::check_catalog(const std::vector<std::string>& available) const {
  std::vector<bool> present(states_.size(), false);
  CatalogCheck check;

  for (const auto& name : available) {
    const auto state = normalize(name);
    if (state.has_value()) {
      present[state->order] = true;
    } else if (std::find(check.extra.begin(), check.extra.end(), name) == check.extra.end()) {
      check.extra.push_back(name);
    }
  }

  for (const auto& state : states_) {
    if (present[state.order]) {
      check.found.push_back(state.canonical_name);
    } else {
      check.missing.push_back(state.canonical_name);
    }
  }
  check.valid = check.missing.empty();
  return check;
}

std::vector<std::string> StateVocabulary::backend_names_for(
    const domain::WorkflowState& state, const std::vector<domain::BackendState>& catalog) const {
  std::vector<std::string> names{state.canonical_name};
  std::set<std::string> keys{core::fold_state_key(state.canonical_name)};

  for (const auto& entry : catalog) {
    const auto normalized = normalize(entry.name);
    if (!normalized.has_value() || normalized->order != state.order) {
      continue;
    }
    if (keys.insert(core::fold_state_key(entry.name)).second) {
      names.push_back(entry.name);
    }
  }
  return names;
}

std::string join_state_names(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

}  // namespace devflow::workflow
