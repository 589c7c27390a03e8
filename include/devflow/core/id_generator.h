#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace devflow::core {

// Source of trace and audit event identifiers.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // "<prefix>-..." and never empty.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// One counter shared by every prefix. An empty run stamp yields
// "<prefix>-<n>"; a non-empty one yields "<prefix>-<stamp>-<n>".
class SequentialIdGenerator final : public IIdGenerator {
 public:
  SequentialIdGenerator() = default;
  explicit SequentialIdGenerator(std::string run_stamp);

  SequentialIdGenerator(const SequentialIdGenerator&) = delete;
  SequentialIdGenerator& operator=(const SequentialIdGenerator&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::string run_stamp_;
  std::atomic<unsigned long long> counter_{0};
};

// Wall-clock microseconds and pid, distinct for concurrent runs writing one audit file.
[[nodiscard]] std::string process_run_stamp();

}  // namespace devflow::core
