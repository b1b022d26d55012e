#pragma once

#include <string>
#include <string_view>

namespace netmap::db {

/*
  Graph store result codes.

  Backends translate their own errors into these; nothing above the
  repository layer sees sqlite codes.

    AlreadyExists        append-only row (observation, host merge) known
    Busy                 contention: sqlite busy/locked, memory key conflict
    ConstraintViolation  row rejected (empty id, schema constraint)
    IOError              disk full, I/O failure
    Corruption           not a database, damaged file
    InternalError        anything else
*/

enum class ErrorCode {
  OK = 0,

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
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
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

// Only contention is worth retrying a whole batch for.
inline bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy;
}

} // namespace netmap::db
