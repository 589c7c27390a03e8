#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace devflow::core {

// Error types following E.14 (use purpose-designed types as error indicators).

// BackendError is a failed read or write against an issue-tracker backend
// (auth, network, not-found, GraphQL error). The message is surfaced verbatim.
struct BackendError {
  std::string message;
};

enum class WorkflowErrorKind {
  kUnknownState,       // requested state does not normalize to a canonical name
  kIllegalTransition,  // both endpoints recognised, pair not allowed
  kBackendError,       // the tracker read/write failed
};

// WorkflowError is what the pickup engine and the transition applier report.
// alternatives always lists what the caller may use instead: the full
// canonical list for kUnknownState, the allowed targets for kIllegalTransition.
struct WorkflowError {
  WorkflowErrorKind kind{WorkflowErrorKind::kBackendError};
  std::string message;
  std::string requested;
  std::string from_state;
  std::string to_state;
  std::vector<std::string> alternatives;
};

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace devflow::core
