#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::db {

// Raises the util exception matching a failed repository result.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + ": " + ErrorCodeName(result.code);
  if (!result.message.empty()) message += " (" + result.message + ")";

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::InvalidState(message);
    default:
      break;
  }
  if (result.Transient()) throw util::InvalidState(message + "; retry");
  throw std::runtime_error(message);
}

} // namespace mirrorsync::db
