#include "bearer.hpp"

#include <string_view>

namespace mirrorsync::grpc {

namespace {

constexpr std::string_view kAuthorization = "authorization";
constexpr std::string_view kScheme        = "Bearer ";

} // namespace

std::string BearerToken(const ::grpc::ServerContext* context) {
  if (context == nullptr) return {};

  const auto& metadata = context->client_metadata();
  const auto  it       = metadata.find(::grpc::string_ref(kAuthorization.data(), kAuthorization.size()));
  if (it == metadata.end()) return {};

  const std::string_view value(it->second.data(), it->second.size());
  if (value.size() <= kScheme.size() || value.substr(0, kScheme.size()) != kScheme) return {};
  return std::string(value.substr(kScheme.size()));
}

void AttachBearer(::grpc::ClientContext& context, const std::string& token) {
  if (token.empty()) return;
  context.AddMetadata(std::string(kAuthorization), std::string(kScheme) + token);
}

} // namespace mirrorsync::grpc
