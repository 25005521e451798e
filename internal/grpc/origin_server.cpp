#include "origin_server.hpp"

#include "bearer.hpp"
#include "grpc_error.hpp"

namespace mirrorsync::grpc {

using namespace mirrorsync::v1;

OriginServer::OriginServer(std::shared_ptr<mirrorsync::service::OriginService> svc) : service_(std::move(svc)) {
}

::grpc::Status OriginServer::Redeem(::grpc::ServerContext*, const RedeemRequest* req, RedeemResponse* resp) {
  try {
    *resp = service_->Redeem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OriginServer::Heartbeat(::grpc::ServerContext* ctx, const HeartbeatRequest* req, HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(BearerToken(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OriginServer::FetchContent(::grpc::ServerContext* ctx, const FetchContentRequest* req, ::grpc::ServerWriter<ContentChunk>* writer) {
  try {
    service_->FetchContent(BearerToken(ctx), *req, [&](const void* data, size_t size, uint64_t offset, uint64_t total) {
      if (ctx->IsCancelled()) return false;
      ContentChunk chunk;
      chunk.set_data(data, size);
      chunk.set_offset(offset);
      chunk.set_total_size(total);
      return writer->Write(chunk);
    });
    if (ctx->IsCancelled()) {
      return {::grpc::StatusCode::CANCELLED, "fetch content: client cancelled"};
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OriginServer::GetMirrorStatus(::grpc::ServerContext* ctx, const GetMirrorStatusRequest* req, GetMirrorStatusResponse* resp) {
  try {
    *resp = service_->GetMirrorStatus(BearerToken(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OriginServer::TriggerSync(::grpc::ServerContext* ctx, const TriggerSyncRequest* req, TriggerSyncResponse* resp) {
  try {
    *resp = service_->TriggerSync(BearerToken(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OriginServer::ResolveDownload(::grpc::ServerContext*, const ResolveDownloadRequest* req, ResolveDownloadResponse* resp) {
  try {
    *resp = service_->ResolveDownload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace mirrorsync::grpc
