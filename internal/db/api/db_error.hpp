#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace artscan::db {

// Converts a failed store Result into the matching util exception.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    case ErrorCode::Conflict:
      throw util::StoreConflict(message);
    default:
      throw std::runtime_error(message + " (" + ErrorCodeName(result.code) + ")");
  }
}

} // namespace artscan::db
