#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "internal/model/endpoint.hpp"
#include "internal/sync/mirror_transport.hpp"
#include "mirrorsync/v1/mirror_service.grpc.pb.h"

namespace mirrorsync::client {

// Blocking client for one mirror node's MirrorService.
class MirrorClient {
 public:
  MirrorClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds rpc_timeout);

  mirrorsync::v1::HealthResponse Health() const;

  mirrorsync::v1::PairResponse Pair(const std::string& code, const std::string& direct_url, const std::string& tunnel_url) const;

  // Calls sink per chunk; returns total bytes received.
  uint64_t Download(const std::string& entry_id, const std::function<void(std::string_view chunk)>& sink) const;

  mirrorsync::v1::ApplySyncResponse ApplySync(const std::string& credential, const mirrorsync::v1::ApplySyncRequest& request) const;

  mirrorsync::v1::ListFilesResponse ListFiles(const std::string& credential) const;

  mirrorsync::v1::ListLogResponse ListLog(const std::string& credential, uint32_t limit) const;

 private:
  std::unique_ptr<mirrorsync::v1::MirrorService::Stub> stub_;
  std::chrono::milliseconds                            rpc_timeout_;
};

/*
  Origin -> mirror delivery of sync instructions.

  Dials each mirror at its effective endpoint (tunnel when configured) and
  keeps one channel per target.
*/
class MirrorTransportClient final : public sync::MirrorTransport {
 public:
  explicit MirrorTransportClient(std::chrono::milliseconds rpc_timeout);

  mirrorsync::v1::ApplySyncResponse ApplySync(const db::model::MirrorRecord& mirror, const mirrorsync::v1::ApplySyncRequest& request) override;

 private:
  std::shared_ptr<MirrorClient> ClientFor(const model::GrpcTarget& target);

  std::chrono::milliseconds                                  rpc_timeout_;
  std::mutex                                                 mutex_;
  std::map<model::GrpcTarget, std::shared_ptr<MirrorClient>> clients_;
};

} // namespace mirrorsync::client
