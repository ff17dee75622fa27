#pragma once

#include <cstdint>
#include <string>

namespace reaper::db {

// Backend-neutral outcome of a catalog write. sqlite and pqxx error
// codes are translated into these before they leave the repository.
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  Busy,
  ConstraintViolation,
  SerializationFailure,
  IOError,
  Corruption,
  InternalError
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;
  // replica rows a refresh or delete actually touched
  uint64_t    rows_affected = 0;

  static Result Ok(uint64_t rows = 0) {
    return Result{ErrorCode::OK, {}, rows};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return Result{code, std::move(message), 0};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace reaper::db
