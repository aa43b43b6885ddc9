#pragma once

#include <string>

namespace negotiation::db {

/*
  Portable store result codes.

  Store implementations must translate backend errors into these.
  Upper layers should never depend on backend error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  // stale state_count on save
  Conflict,
  // record is leased by another holder
  LeaseConflict,

  InvalidArgument,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace negotiation::db
