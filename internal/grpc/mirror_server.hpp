#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/mirror_service.hpp"
#include "mirrorsync/v1/mirror_service.grpc.pb.h"

namespace mirrorsync::grpc {

class MirrorServer final : public mirrorsync::v1::MirrorService::Service {
 public:
  explicit MirrorServer(std::shared_ptr<mirrorsync::service::MirrorService> svc);

  ::grpc::Status Health(::grpc::ServerContext*, const mirrorsync::v1::HealthRequest*, mirrorsync::v1::HealthResponse*) override;

  ::grpc::Status Pair(::grpc::ServerContext*, const mirrorsync::v1::PairRequest*, mirrorsync::v1::PairResponse*) override;

  ::grpc::Status Download(::grpc::ServerContext*, const mirrorsync::v1::DownloadRequest*,
                          ::grpc::ServerWriter<mirrorsync::v1::DownloadChunk>*) override;

  ::grpc::Status ApplySync(::grpc::ServerContext*, const mirrorsync::v1::ApplySyncRequest*, mirrorsync::v1::ApplySyncResponse*) override;

  ::grpc::Status ListFiles(::grpc::ServerContext*, const mirrorsync::v1::ListFilesRequest*, mirrorsync::v1::ListFilesResponse*) override;

  ::grpc::Status ListLog(::grpc::ServerContext*, const mirrorsync::v1::ListLogRequest*, mirrorsync::v1::ListLogResponse*) override;

 private:
  std::shared_ptr<mirrorsync::service::MirrorService> service_;
};

} // namespace mirrorsync::grpc
