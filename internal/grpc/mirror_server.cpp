#include "mirror_server.hpp"

#include "bearer.hpp"
#include "grpc_error.hpp"

namespace mirrorsync::grpc {

using namespace mirrorsync::v1;

MirrorServer::MirrorServer(std::shared_ptr<mirrorsync::service::MirrorService> svc) : service_(std::move(svc)) {
}

::grpc::Status MirrorServer::Health(::grpc::ServerContext*, const HealthRequest* req, HealthResponse* resp) {
  try {
    *resp = service_->Health(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::Pair(::grpc::ServerContext*, const PairRequest* req, PairResponse* resp) {
  try {
    *resp = service_->Pair(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::Download(::grpc::ServerContext* ctx, const DownloadRequest* req, ::grpc::ServerWriter<DownloadChunk>* writer) {
  try {
    const bool complete = service_->Download(
        *req,
        [&](const void* data, size_t size, uint64_t offset, uint64_t total) {
          DownloadChunk chunk;
          chunk.set_data(data, size);
          chunk.set_offset(offset);
          chunk.set_total_size(total);
          return writer->Write(chunk);
        },
        [ctx] { return ctx->IsCancelled(); });
    if (!complete) {
      return {::grpc::StatusCode::CANCELLED, "download: client went away"};
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::ApplySync(::grpc::ServerContext* ctx, const ApplySyncRequest* req, ApplySyncResponse* resp) {
  try {
    *resp = service_->ApplySync(BearerToken(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::ListFiles(::grpc::ServerContext* ctx, const ListFilesRequest* req, ListFilesResponse* resp) {
  try {
    *resp = service_->ListFiles(BearerToken(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::ListLog(::grpc::ServerContext* ctx, const ListLogRequest* req, ListLogResponse* resp) {
  try {
    *resp = service_->ListLog(BearerToken(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace mirrorsync::grpc
