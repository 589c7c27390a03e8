#include "devflow/workflow/priority_model.h"

#include "devflow/core/clock.h"
#include "devflow/core/normalization.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace devflow::workflow {

PriorityModel::PriorityModel(PriorityTable table) : table_(std::move(table)) {
  for (const auto& level : table_.levels) {
    if (level.rank > table_.unranked) {
      throw std::invalid_argument("priority level '" + level.name +
                                  "' ranks worse than unranked issues");
    }
  }
}

int PriorityModel::rank(const domain::Issue& issue) const {
  if (issue.priority_code.has_value()) {
    const int code = issue.priority_code.value();
    for (const auto& level : table_.levels) {
      if (std::find(level.codes.begin(), level.codes.end(), code) != level.codes.end()) {
        return level.rank;
      }
    }
  }

  int best = table_.unranked;
  for (const auto& label : issue.labels) {
    const std::string key = core::normalize_ascii_lower(core::trim(label));
    for (const auto& level : table_.levels) {
      if (level.rank >= best) {
        continue;
      }
      for (const auto& candidate : level.labels) {
        if (core::normalize_ascii_lower(candidate) == key) {
          best = level.rank;
          break;
        }
      }
    }
  }
  return best;
}

bool PriorityModel::precedes(const domain::Issue& a, const domain::Issue& b) const {
  return compare(a, b) < 0;
}

int PriorityModel::compare(const domain::Issue& a, const domain::Issue& b) const {
  const int rank_a = rank(a);
  const int rank_b = rank(b);
  if (rank_a != rank_b) {
    return rank_a < rank_b ? -1 : 1;
  }

  return compare_created_at(a.created_at, b.created_at);
}

int compare_created_at(const std::string& a, const std::string& b) {
  // Tiers: parsed timestamps, then unparsable text, then missing.
  const auto parsed_a = core::parse_iso8601(a);
  const auto parsed_b = core::parse_iso8601(b);
  const int tier_a = parsed_a.has_value() ? 0 : (a.empty() ? 2 : 1);
  const int tier_b = parsed_b.has_value() ? 0 : (b.empty() ? 2 : 1);
  if (tier_a != tier_b) {
    return tier_a < tier_b ? -1 : 1;
  }
  if (tier_a == 0) {
    if (*parsed_a == *parsed_b) {
      return 0;
    }
    return *parsed_a < *parsed_b ? -1 : 1;
  }
  const int cmp = a.compare(b);
  if (cmp == 0) {
    return 0;
  }
  return cmp < 0 ? -1 : 1;
}

void PriorityModel::sort(std::vector<domain::Issue>& issues) const {
  std::stable_sort(issues.begin(), issues.end(),
                   [this](const domain::Issue& a, const domain::Issue& b) { return precedes(a, b); });
}

std::string PriorityModel::level_name(const int rank) const {
  for (const auto& level : table_.levels) {
    if (level.rank == rank) {
      return level.name;
    }
  }
  return table_.unranked_name;
}

}  // namespace devflow::workflow
