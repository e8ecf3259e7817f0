#pragma once

#include <string>

namespace analysis::db {

/*
  Outcome of one repository write.

  Backends translate their native errors into these codes; the broker and
  backend channels only ever see db::Result, never sqlite3 return codes.
*/
enum class ErrorCode {
  OK = 0,

  // (channel, task_id) missing / already present
  NotFound,
  AlreadyExists,

  // another process holds the write lock past the busy timeout
  Busy,
  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
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

  // "busy: database is locked"
  std::string Describe() const {
    return message.empty() ? ToString(code) : std::string(ToString(code)) + ": " + message;
  }
};

// Throws E(prefix + ": " + description) unless the result is OK.
template <typename E>
void ThrowIfError(const Result& result, const std::string& prefix) {
  if (!result) {
    throw E(prefix + ": " + result.Describe());
  }
}

} // namespace analysis::db
