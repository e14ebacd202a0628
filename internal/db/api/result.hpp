#pragma once

#include <string>

namespace shopstore::db {

/*
  Portable store result codes.

  Backends must translate engine errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  // address does not resolve to a store, or the store refuses to open
  Unavailable,
  Closed,
  Cancelled,

  IOError,
  Corruption,

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

const char* ToString(ErrorCode code);

} // namespace shopstore::db
