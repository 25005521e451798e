#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace mirrorsync::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The error kind is carried in error_details so that ThrowIfError can raise
  the same exception type on the far side of a call, even where two kinds
  share a status code.
*/

::grpc::Status ToStatus(const std::exception& e);

// Rethrows a failed status as the matching util exception. OK is a no-op.
void ThrowIfError(const ::grpc::Status& status, const std::string& action);

} // namespace mirrorsync::grpc
