#pragma once

#include <string>
#include <string_view>

namespace flowstore::db {

/*
  Portable DB result codes.

  The repository layer translates sqlite result codes into these.
  Upper layers never look at sqlite error codes.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,

  ConstraintViolation,

  IOError,
  Full,
  Corruption,
  ReadOnly,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Full:
      return "database full";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::ReadOnly:
      return "read only";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

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

} // namespace flowstore::db
