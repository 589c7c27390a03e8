#include "devflow/core/id_generator.h"

#include <unistd.h>

#include <chrono>
#include <utility>

namespace devflow::core {

SequentialIdGenerator::SequentialIdGenerator(std::string run_stamp)
    : run_stamp_(std::move(run_stamp)) {}

std::string SequentialIdGenerator::next(std::string_view prefix) {
  std::string id(prefix);
  id += '-';
  if (!run_stamp_.empty()) {
    id += run_stamp_;
    id += '-';
  }
  id += std::to_string(counter_.fetch_add(1, std::memory_order_relaxed));
  return id;
}

std::string process_run_stamp() {
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return std::to_string(micros) + "." + std::to_string(::getpid());
}

}  // namespace devflow::core
