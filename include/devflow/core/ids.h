#pragma once

#include "devflow/core/id_generator.h"

#include <string>

namespace devflow::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).

// IssueId is the identifier a human types: "42" on the board backend,
// "ASA-42" on the linear backend.
struct IssueId {
  std::string value;
  auto operator<=>(const IssueId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

struct WorkerId {
  std::string value;
  auto operator<=>(const WorkerId&) const = default;
};

inline TraceId new_trace_id(IIdGenerator& gen) { return TraceId{gen.next("trace")}; }

}  // namespace devflow::core
