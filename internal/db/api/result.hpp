#pragma once

#include <string>
#include <utility>

namespace artscan::db {

// Backend-neutral outcome of a catalog store call. Repositories translate
// sqlite and libpqxx failures into these codes; callers above the store
// see nothing backend-specific.
enum class ErrorCode {
  OK = 0,
  NotFound,
  ConstraintViolation, // missing title, bad dimension, dangling museum_id
  Conflict,            // concurrent writer won; the unit of work may be retried
  Busy,
  IOError,
  Corruption,
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal_error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace artscan::db
