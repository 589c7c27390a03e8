#include "devflow/domain/workflow_state.h"

namespace devflow::domain {

std::string_view ownership_to_string(const Ownership ownership) {
  switch (ownership) {
    case Ownership::kHuman:
      return "human";
    case Ownership::kHumanToAgent:
      return "human->agent";
    case Ownership::kAgent:
      return "agent";
    case Ownership::kArchive:
      return "archive";
  }
  return "unknown";
}

}  // namespace devflow::domain
