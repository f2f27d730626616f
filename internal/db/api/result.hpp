#pragma once

#include <string>
#include <string_view>

namespace recall::db {

/*
  Portable DB result codes.

  Each backend translates its native errors (sqlite rc, pqxx exceptions,
  in-memory checks) into these. The store maps them onto the engine's
  error types; nothing above the repository sees backend error types.

  A duplicate active slot (same owner, subject and predicate) is always
  ConstraintViolation, never AlreadyExists: AlreadyExists is reserved for
  a reused record, job or audit id.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::SerializationFailure: return "serialization failure";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
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

  // "<context>: <code>[: <message>]" for logs and rethrown errors.
  std::string Describe(std::string_view context) const {
    std::string out(context);
    out += ": ";
    out += ErrorCodeName(code);
    if (!message.empty()) {
      out += ": ";
      out += message;
    }
    return out;
  }
};

} // namespace recall::db
