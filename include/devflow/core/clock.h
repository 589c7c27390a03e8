#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace devflow::core {

using Instant = std::chrono::system_clock::time_point;

// "2026-01-01T00:00:00Z". Sub-second precision is dropped.
[[nodiscard]] std::string format_utc(Instant instant);

// Parses an RFC 3339 timestamp: "2026-01-01T09:30:00Z",
// "2026-01-01T09:30:00.123+02:00" or a bare date. The zone defaults to UTC
// when absent. nullopt for anything else, years outside 1700-2200 included.
[[nodiscard]] std::optional<Instant> parse_iso8601(std::string_view text);

// Time source for audit timestamps.
class IClock {
 public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual Instant now() const = 0;

  [[nodiscard]] std::string now_iso8601() const { return format_utc(now()); }

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  [[nodiscard]] Instant now() const override { return std::chrono::system_clock::now(); }
};

// Frozen at one instant; advance() moves it forward.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(Instant at) : at_(at) {}

  [[nodiscard]] Instant now() const override { return at_; }

  void advance(std::chrono::seconds by) { at_ += by; }

 private:
  Instant at_;
};

}  // namespace devflow::core
