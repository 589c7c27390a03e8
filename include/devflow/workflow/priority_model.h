#pragma once

#include "devflow/domain/issue.h"

#include <string>
#include <string_view>
#include <vector>

namespace devflow::workflow {

// PriorityLevel is one row of a flavor's priority table.
// A level matches an issue by label (case-insensitive, board flavor) or by
// numeric code (linear flavor).
struct PriorityLevel {
  std::string name;
  int rank{0};
  std::vector<std::string> labels;
  std::vector<int> codes;
};

struct PriorityTable {
  std::vector<PriorityLevel> levels;  // display order
  int unranked{0};                    // rank of issues matching no level; must be the worst
  std::string unranked_name{"No priority"};
};

// Orders creation timestamps by the instant they name, so "+02:00" offsets and
// fractional seconds compare correctly. Unparsable values sort after every
// parsable one (by text), and empty values sort last. -1, 0 or 1.
[[nodiscard]] int compare_created_at(const std::string& a, const std::string& b);

// PriorityModel maps issues to ranks (lower is more urgent) and orders them by
// (rank, created_at). Ordering is a strict weak ordering; sort() is stable so
// full ties keep their input order.
class PriorityModel {
 public:
  // Throws std::invalid_argument when a level ranks worse than unranked.
  explicit PriorityModel(PriorityTable table);

  // A mapped priority code wins; otherwise the most urgent matching label;
  // otherwise the unranked value.
  [[nodiscard]] int rank(const domain::Issue& issue) const;

  // True when a must be picked before b. Within a rank the older created_at
  // wins (see compare_created_at).
  [[nodiscard]] bool precedes(const domain::Issue& a, const domain::Issue& b) const;

  // -1, 0 or 1.
  [[nodiscard]] int compare(const domain::Issue& a, const domain::Issue& b) const;

  void sort(std::vector<domain::Issue>& issues) const;

  // Level name for a rank ("High", "P: HIGH"); unranked_name when no level has it.
  [[nodiscard]] std::string level_name(int rank) const;

  [[nodiscard]] int unranked() const { return table_.unranked; }
  [[nodiscard]] const std::vector<PriorityLevel>& levels() const { return table_.levels; }
  [[nodiscard]] const std::string& unranked_name() const { return table_.unranked_name; }

 private:
  PriorityTable table_;
};

}  // namespace devflow::workflow
