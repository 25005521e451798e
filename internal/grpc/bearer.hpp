#pragma once

#include <string>

#include <grpcpp/grpcpp.h>

namespace mirrorsync::grpc {

// Token from "authorization: Bearer <token>" metadata; empty when absent.
std::string BearerToken(const ::grpc::ServerContext* context);

void AttachBearer(::grpc::ClientContext& context, const std::string& token);

} // namespace mirrorsync::grpc
