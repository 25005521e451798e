#include "client/cpp/mirror_client.h"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/grpc/bearer.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/model/endpoint.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::client {

using namespace mirrorsync::v1;

namespace {

void SetDeadline(::grpc::ClientContext& ctx, std::chrono::milliseconds timeout) {
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
}

} // namespace

MirrorClient::MirrorClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds rpc_timeout)
    : stub_(MirrorService::NewStub(channel)), rpc_timeout_(rpc_timeout) {
}

HealthResponse MirrorClient::Health() const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  HealthResponse resp;
  grpc::ThrowIfError(stub_->Health(&ctx, HealthRequest{}, &resp), "health");
  return resp;
}

PairResponse MirrorClient::Pair(const std::string& code, const std::string& direct_url, const std::string& tunnel_url) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);

  PairRequest req;
  req.set_pairing_code(code);
  req.set_direct_url(direct_url);
  req.set_tunnel_url(tunnel_url);
  PairResponse resp;
  grpc::ThrowIfError(stub_->Pair(&ctx, req, &resp), "pair");
  return resp;
}

uint64_t MirrorClient::Download(const std::string& entry_id, const std::function<void(std::string_view chunk)>& sink) const {
  // Paced downloads may run far longer than a unary call.
  ::grpc::ClientContext ctx;

  DownloadRequest req;
  req.set_entry_id(entry_id);

  auto          reader   = stub_->Download(&ctx, req);
  DownloadChunk chunk;
  uint64_t      received = 0;
  while (reader->Read(&chunk)) {
    received += chunk.data().size();
    sink(chunk.data());
  }
  grpc::ThrowIfError(reader->Finish(), "download " + entry_id);
  return received;
}

ApplySyncResponse MirrorClient::ApplySync(const std::string& credential, const ApplySyncRequest& request) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, credential);

  ApplySyncResponse resp;
  grpc::ThrowIfError(stub_->ApplySync(&ctx, request, &resp), "apply sync");
  return resp;
}

ListFilesResponse MirrorClient::ListFiles(const std::string& credential) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, credential);

  ListFilesResponse resp;
  grpc::ThrowIfError(stub_->ListFiles(&ctx, ListFilesRequest{}, &resp), "list files");
  return resp;
}

ListLogResponse MirrorClient::ListLog(const std::string& credential, uint32_t limit) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, credential);

  ListLogRequest req;
  req.set_limit(limit);

  ListLogResponse resp;
  grpc::ThrowIfError(stub_->ListLog(&ctx, req, &resp), "list log");
  return resp;
}

MirrorTransportClient::MirrorTransportClient(std::chrono::milliseconds rpc_timeout) : rpc_timeout_(rpc_timeout) {
}

std::shared_ptr<MirrorClient> MirrorTransportClient::ClientFor(const model::GrpcTarget& target) {
  std::lock_guard lock(mutex_);
  auto&           client = clients_[target];
  if (!client) {
    auto credentials = target.tls ? ::grpc::SslCredentials(::grpc::SslCredentialsOptions()) : ::grpc::InsecureChannelCredentials();
    client           = std::make_shared<MirrorClient>(::grpc::CreateChannel(target.address, credentials), rpc_timeout_);
  }
  return client;
}

ApplySyncResponse MirrorTransportClient::ApplySync(const db::model::MirrorRecord& mirror, const ApplySyncRequest& request) {
  const auto target = model::ToGrpcTarget(model::EndpointOf(mirror.direct_url, mirror.tunnel_url));
  if (target.address.empty()) {
    throw util::Unreachable("apply sync: mirror " + mirror.id + " has no reachable address");
  }
  return ClientFor(target)->ApplySync(mirror.credential, request);
}

} // namespace mirrorsync::client
