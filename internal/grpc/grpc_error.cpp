#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace mirrorsync::grpc {

namespace {

::grpc::Status Tagged(::grpc::StatusCode code, const char* kind, const std::exception& e) {
  return {code, e.what(), kind};
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace mirrorsync::util;

  if (dynamic_cast<const InvalidCode*>(&e)) {
    return Tagged(::grpc::StatusCode::NOT_FOUND, "InvalidCode", e);
  }
  if (dynamic_cast<const ExpiredCode*>(&e)) {
    return Tagged(::grpc::StatusCode::FAILED_PRECONDITION, "ExpiredCode", e);
  }
  if (dynamic_cast<const AlreadyConsumed*>(&e)) {
    return Tagged(::grpc::StatusCode::ALREADY_EXISTS, "AlreadyConsumed", e);
  }
  if (dynamic_cast<const RateLimited*>(&e)) {
    return Tagged(::grpc::StatusCode::RESOURCE_EXHAUSTED, "RateLimited", e);
  }
  if (dynamic_cast<const Unauthenticated*>(&e)) {
    return Tagged(::grpc::StatusCode::UNAUTHENTICATED, "Unauthenticated", e);
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return Tagged(::grpc::StatusCode::NOT_FOUND, "NotFound", e);
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return Tagged(::grpc::StatusCode::FAILED_PRECONDITION, "InvalidState", e);
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return Tagged(::grpc::StatusCode::INVALID_ARGUMENT, "InvalidArgument", e);
  }
  if (dynamic_cast<const Unreachable*>(&e)) {
    return Tagged(::grpc::StatusCode::UNAVAILABLE, "Unreachable", e);
  }
  if (dynamic_cast<const HashMismatch*>(&e)) {
    return Tagged(::grpc::StatusCode::DATA_LOSS, "HashMismatch", e);
  }
  if (dynamic_cast<const CapacityExceeded*>(&e)) {
    return Tagged(::grpc::StatusCode::RESOURCE_EXHAUSTED, "CapacityExceeded", e);
  }
  if (dynamic_cast<const AlreadyRunning*>(&e)) {
    return Tagged(::grpc::StatusCode::ABORTED, "AlreadyRunning", e);
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfError(const ::grpc::Status& status, const std::string& action) {
  using namespace mirrorsync::util;

  if (status.ok()) {
    return;
  }

  const std::string  msg  = action + " failed: " + status.error_message();
  const std::string& kind = status.error_details();

  if (kind == "InvalidCode") throw InvalidCode(msg);
  if (kind == "ExpiredCode") throw ExpiredCode(msg);
  if (kind == "AlreadyConsumed") throw AlreadyConsumed(msg);
  if (kind == "RateLimited") throw RateLimited(msg);
  if (kind == "CapacityExceeded") throw CapacityExceeded(msg);
  if (kind == "HashMismatch") throw HashMismatch(msg);

  // untagged statuses come from the transport itself or a foreign server
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      throw NotFound(msg);
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      throw InvalidState(msg);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      throw InvalidArgument(msg);
    case ::grpc::StatusCode::UNAUTHENTICATED:
    case ::grpc::StatusCode::PERMISSION_DENIED:
      throw Unauthenticated(msg);
    case ::grpc::StatusCode::ABORTED:
      throw AlreadyRunning(msg);
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::CANCELLED:
      throw Unreachable(msg);
    default:
      throw std::runtime_error(msg);
  }
}

} // namespace mirrorsync::grpc
