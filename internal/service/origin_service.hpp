#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "internal/service/authorizer.hpp"
#include "internal/service/service_context.hpp"
#include "mirrorsync/v1/origin_service.pb.h"

namespace mirrorsync::service {

/*
  Origin endpoints used by mirror agents and download front ends.

  `bearer` is the token from the caller's authorization metadata, empty
  when none was sent.
*/
class OriginService {
 public:
  static constexpr size_t kContentChunkBytes = 64 * 1024;

  // Returns false once the receiver is gone.
  using ChunkSink = std::function<bool(const void* data, size_t size, uint64_t offset, uint64_t total)>;

  explicit OriginService(ServiceContext ctx);

  mirrorsync::v1::RedeemResponse Redeem(const mirrorsync::v1::RedeemRequest& req);

  mirrorsync::v1::HeartbeatResponse Heartbeat(const std::string& bearer, const mirrorsync::v1::HeartbeatRequest& req);

  // Streams an approved entry's archive bytes to an approved or online mirror.
  void FetchContent(const std::string& bearer, const mirrorsync::v1::FetchContentRequest& req, const ChunkSink& sink);

  mirrorsync::v1::GetMirrorStatusResponse GetMirrorStatus(const std::string& bearer, const mirrorsync::v1::GetMirrorStatusRequest& req);

  mirrorsync::v1::TriggerSyncResponse TriggerSync(const std::string& bearer, const mirrorsync::v1::TriggerSyncRequest& req);

  mirrorsync::v1::ResolveDownloadResponse ResolveDownload(const mirrorsync::v1::ResolveDownloadRequest& req);

 private:
  ServiceContext ctx_;
  Authorizer     auth_;
};

} // namespace mirrorsync::service
