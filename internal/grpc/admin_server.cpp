#include "admin_server.hpp"

#include "bearer.hpp"
#include "grpc_error.hpp"

namespace mirrorsync::grpc {

using namespace mirrorsync::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<mirrorsync::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::IssuePairingCode(::grpc::ServerContext* ctx, const IssuePairingCodeRequest* req, IssuePairingCodeResponse* resp) {
  return Handle([&] { *resp = service_->IssuePairingCode(BearerToken(ctx), *req); });
}

::grpc::Status AdminServer::ApproveMirror(::grpc::ServerContext* ctx, const ApproveMirrorRequest* req, MirrorResponse* resp) {
  return Handle([&] { *resp = service_->ApproveMirror(BearerToken(ctx), *req); });
}

::grpc::Status AdminServer::RejectMirror(::grpc::ServerContext* ctx, const RejectMirrorRequest* req, MirrorResponse* resp) {
  return Handle([&] { *resp = service_->RejectMirror(BearerToken(ctx), *req); });
}

::grpc::Status AdminServer::ListMirrors(::grpc::ServerContext* ctx, const ListMirrorsRequest* req, ListMirrorsResponse* resp) {
  return Handle([&] { *resp = service_->ListMirrors(BearerToken(ctx), *req); });
}

::grpc::Status AdminServer::ListSyncLog(::grpc::ServerContext* ctx, const ListSyncLogRequest* req, ListSyncLogResponse* resp) {
  return Handle([&] { *resp = service_->ListSyncLog(BearerToken(ctx), *req); });
}

::grpc::Status AdminServer::NotifyCatalogChanged(::grpc::ServerContext* ctx, const NotifyCatalogChangedRequest* req,
                                                 NotifyCatalogChangedResponse* resp) {
  return Handle([&] { *resp = service_->NotifyCatalogChanged(BearerToken(ctx), *req); });
}

} // namespace mirrorsync::grpc
