#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "mirrorsync/v1/admin_service.grpc.pb.h"

namespace mirrorsync::grpc {

class AdminServer final : public mirrorsync::v1::MirrorAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<mirrorsync::service::AdminService> svc);

  ::grpc::Status IssuePairingCode(::grpc::ServerContext*, const mirrorsync::v1::IssuePairingCodeRequest*,
                                  mirrorsync::v1::IssuePairingCodeResponse*) override;

  ::grpc::Status ApproveMirror(::grpc::ServerContext*, const mirrorsync::v1::ApproveMirrorRequest*, mirrorsync::v1::MirrorResponse*) override;

  ::grpc::Status RejectMirror(::grpc::ServerContext*, const mirrorsync::v1::RejectMirrorRequest*, mirrorsync::v1::MirrorResponse*) override;

  ::grpc::Status ListMirrors(::grpc::ServerContext*, const mirrorsync::v1::ListMirrorsRequest*, mirrorsync::v1::ListMirrorsResponse*) override;

  ::grpc::Status ListSyncLog(::grpc::ServerContext*, const mirrorsync::v1::ListSyncLogRequest*, mirrorsync::v1::ListSyncLogResponse*) override;

  ::grpc::Status NotifyCatalogChanged(::grpc::ServerContext*, const mirrorsync::v1::NotifyCatalogChangedRequest*,
                                      mirrorsync::v1::NotifyCatalogChangedResponse*) override;

 private:
  std::shared_ptr<mirrorsync::service::AdminService> service_;
};

} // namespace mirrorsync::grpc
