#pragma once

#include <string>

namespace mirrorsync::db {

/*
  Repository outcome shared by the memory, sqlite and postgres backends.

  Each backend maps its own failures onto ErrorCode so the registry,
  pairing and sync code never see a sqlite rc or a pqxx exception:
    AlreadyExists        duplicate mirror id, credential, pairing code or
                         catalog id
    NotFound             update or delete of a row that is not there
    Busy                 database locked by another process past the timeout
    SerializationFailure postgres retry-required abort
*/
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

inline const char* ErrorCodeName(ErrorCode code) {
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
    case ErrorCode::SerializationFailure:
      return "serialization failure";
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

  // A sync pass or heartbeat that hit one of these can simply run again.
  bool Transient() const {
    return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace mirrorsync::db
