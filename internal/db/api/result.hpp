#pragma once

#include <string>
#include <utility>

namespace sitepull::db {

/*
  Portable DB result codes.

  Backends translate sqlite/pqxx errors into these; the layers above turn a
  failed Result into an exception at their boundary.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,

  ConstraintViolation,
  ValueTooLarge,

  IOError,
  Corruption,

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

} // namespace sitepull::db
