#include "client/cpp/origin_client.h"

#include <grpcpp/client_context.h>

#include "internal/grpc/bearer.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace mirrorsync::client {

using namespace mirrorsync::v1;

namespace {

void SetDeadline(::grpc::ClientContext& ctx, std::chrono::milliseconds timeout) {
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
}

} // namespace

OriginClient::OriginClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds rpc_timeout, std::chrono::milliseconds fetch_timeout)
    : origin_stub_(OriginService::NewStub(channel)),
      admin_stub_(MirrorAdminService::NewStub(channel)),
      rpc_timeout_(rpc_timeout),
      fetch_timeout_(fetch_timeout) {
}

RedeemResponse OriginClient::Redeem(const RedeemRequest& request) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  RedeemResponse resp;
  grpc::ThrowIfError(origin_stub_->Redeem(&ctx, request, &resp), "redeem pairing code");
  return resp;
}

MirrorStatus OriginClient::Heartbeat(const std::string& credential, const MirrorCounters& counters) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, credential);

  HeartbeatRequest req;
  *req.mutable_counters() = counters;
  HeartbeatResponse resp;
  grpc::ThrowIfError(origin_stub_->Heartbeat(&ctx, req, &resp), "heartbeat");
  return resp.status();
}

void OriginClient::FetchContent(const std::string& credential, const std::string& entry_id, const std::function<void(std::string_view chunk)>& sink) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, fetch_timeout_);
  grpc::AttachBearer(ctx, credential);

  FetchContentRequest req;
  req.set_entry_id(entry_id);

  auto         reader = origin_stub_->FetchContent(&ctx, req);
  ContentChunk chunk;
  try {
    while (reader->Read(&chunk)) {
      sink(chunk.data());
    }
  } catch (const std::exception&) {
    ctx.TryCancel();
    const auto status = reader->Finish();
    MIRRORSYNC_LOG_DEBUG("fetch stream abandoned", {observability::StringField("entry_id", entry_id),
                                                    observability::StringField("status", status.error_message())});
    throw;
  }
  grpc::ThrowIfError(reader->Finish(), "fetch content " + entry_id);
}

TriggerSyncResponse OriginClient::TriggerSync(const std::string& token, const std::string& mirror_id) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, token);

  TriggerSyncRequest req;
  req.set_mirror_id(mirror_id);
  TriggerSyncResponse resp;
  grpc::ThrowIfError(origin_stub_->TriggerSync(&ctx, req, &resp), "trigger sync");
  return resp;
}

GetMirrorStatusResponse OriginClient::GetMirrorStatus(const std::string& token, const std::string& mirror_id) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, token);

  GetMirrorStatusRequest req;
  req.set_mirror_id(mirror_id);
  GetMirrorStatusResponse resp;
  grpc::ThrowIfError(origin_stub_->GetMirrorStatus(&ctx, req, &resp), "get mirror status");
  return resp;
}

ResolveDownloadResponse OriginClient::ResolveDownload(const std::string& entry_id) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);

  ResolveDownloadRequest req;
  req.set_entry_id(entry_id);
  ResolveDownloadResponse resp;
  grpc::ThrowIfError(origin_stub_->ResolveDownload(&ctx, req, &resp), "resolve download");
  return resp;
}

IssuePairingCodeResponse OriginClient::IssuePairingCode(const std::string& token) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, token);

  IssuePairingCodeResponse resp;
  grpc::ThrowIfError(admin_stub_->IssuePairingCode(&ctx, IssuePairingCodeRequest{}, &resp), "issue pairing code");
  return resp;
}

MirrorResponse OriginClient::ApproveMirror(const std::string& token, const std::string& mirror_id) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, token);

  ApproveMirrorRequest req;
  req.set_mirror_id(mirror_id);
  MirrorResponse resp;
  grpc::ThrowIfError(admin_stub_->ApproveMirror(&ctx, req, &resp), "approve mirror");
  return resp;
}

MirrorResponse OriginClient::RejectMirror(const std::string& token, const std::string& mirror_id) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, token);

  RejectMirrorRequest req;
  req.set_mirror_id(mirror_id);
  MirrorResponse resp;
  grpc::ThrowIfError(admin_stub_->RejectMirror(&ctx, req, &resp), "reject mirror");
  return resp;
}

ListMirrorsResponse OriginClient::ListMirrors(const std::string& token) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, token);

  ListMirrorsResponse resp;
  grpc::ThrowIfError(admin_stub_->ListMirrors(&ctx, ListMirrorsRequest{}, &resp), "list mirrors");
  return resp;
}

ListSyncLogResponse OriginClient::ListSyncLog(const std::string& token, const std::string& mirror_id, uint32_t limit) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, token);

  ListSyncLogRequest req;
  req.set_mirror_id(mirror_id);
  req.set_limit(limit);
  ListSyncLogResponse resp;
  grpc::ThrowIfError(admin_stub_->ListSyncLog(&ctx, req, &resp), "list sync log");
  return resp;
}

NotifyCatalogChangedResponse OriginClient::NotifyCatalogChanged(const std::string& token) const {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);
  grpc::AttachBearer(ctx, token);

  NotifyCatalogChangedResponse resp;
  grpc::ThrowIfError(admin_stub_->NotifyCatalogChanged(&ctx, NotifyCatalogChangedRequest{}, &resp), "notify catalog changed");
  return resp;
}

} // namespace mirrorsync::client
