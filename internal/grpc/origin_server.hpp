#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/origin_service.hpp"
#include "mirrorsync/v1/origin_service.grpc.pb.h"

namespace mirrorsync::grpc {

class OriginServer final : public mirrorsync::v1::OriginService::Service {
 public:
  explicit OriginServer(std::shared_ptr<mirrorsync::service::OriginService> svc);

  ::grpc::Status Redeem(::grpc::ServerContext*, const mirrorsync::v1::RedeemRequest*, mirrorsync::v1::RedeemResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*, const mirrorsync::v1::HeartbeatRequest*, mirrorsync::v1::HeartbeatResponse*) override;

  ::grpc::Status FetchContent(::grpc::ServerContext*, const mirrorsync::v1::FetchContentRequest*,
                              ::grpc::ServerWriter<mirrorsync::v1::ContentChunk>*) override;

  ::grpc::Status GetMirrorStatus(::grpc::ServerContext*, const mirrorsync::v1::GetMirrorStatusRequest*,
                                 mirrorsync::v1::GetMirrorStatusResponse*) override;

  ::grpc::Status TriggerSync(::grpc::ServerContext*, const mirrorsync::v1::TriggerSyncRequest*, mirrorsync::v1::TriggerSyncResponse*) override;

  ::grpc::Status ResolveDownload(::grpc::ServerContext*, const mirrorsync::v1::ResolveDownloadRequest*,
                                 mirrorsync::v1::ResolveDownloadResponse*) override;

 private:
  std::shared_ptr<mirrorsync::service::OriginService> service_;
};

} // namespace mirrorsync::grpc
