#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace negotiation::util {

/*
  Outcome of a manager or service operation.

  Expected domain conditions (unknown id, guard violation, stale version,
  invalid query filter) are carried as failures, never thrown.
*/

enum class FailureReason {
  kNotFound,
  kConflict,
  kBadRequest,
  kFatal,
  kTransient,
};

constexpr std::string_view ToString(FailureReason reason) {
  switch (reason) {
    case FailureReason::kNotFound:
      return "NOT_FOUND";
    case FailureReason::kConflict:
      return "CONFLICT";
    case FailureReason::kBadRequest:
      return "BAD_REQUEST";
    case FailureReason::kFatal:
      return "FATAL";
    case FailureReason::kTransient:
      return "TRANSIENT";
  }
  return "UNKNOWN";
}

template <typename T>
class StatusResult {
 public:
  static StatusResult Success(T content) {
    StatusResult result;
    result.content_ = std::move(content);
    return result;
  }

  static StatusResult Failure(FailureReason reason, std::string message = {}) {
    StatusResult result;
    result.reason_  = reason;
    result.message_ = std::move(message);
    return result;
  }

  // Re-types a failure, e.g. a store lookup failure surfaced by a query.
  template <typename U>
  static StatusResult FailureFrom(const StatusResult<U>& other) {
    return Failure(other.Reason(), other.Message());
  }

  bool Succeeded() const {
    return content_.has_value();
  }

  bool Failed() const {
    return !content_.has_value();
  }

  explicit operator bool() const {
    return Succeeded();
  }

  const T& Content() const {
    return *content_;
  }

  T& Content() {
    return *content_;
  }

  FailureReason Reason() const {
    return reason_;
  }

  const std::string& Message() const {
    return message_;
  }

 private:
  StatusResult() = default;

  std::optional<T> content_;
  FailureReason    reason_ = FailureReason::kFatal;
  std::string      message_;
};

} // namespace negotiation::util
