#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace stockcount::db {

/*
  Outcome of a repository write.

  Backends map their native errors onto these codes; the session layer
  only distinguishes NotFound and AlreadyExists and treats the rest as
  storage failures.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal";
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

// Throws util::StorageError for a failed result.
inline void ThrowIfFailed(const Result& result, std::string_view action) {
  if (result) return;

  std::string what(action);
  what += " failed (";
  what += ToString(result.code);
  what += ")";
  if (!result.message.empty()) {
    what += ": " + result.message;
  }
  throw util::StorageError(what);
}

} // namespace stockcount::db
