#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/agent/mirror_agent.hpp"
#include "mirrorsync/v1/mirror_service.pb.h"

namespace mirrorsync::service {

// Endpoints served by a mirror node.
class MirrorService {
 public:
  explicit MirrorService(std::shared_ptr<agent::MirrorAgent> agent);

  mirrorsync::v1::HealthResponse Health(const mirrorsync::v1::HealthRequest& req);

  mirrorsync::v1::PairResponse Pair(const mirrorsync::v1::PairRequest& req);

  // False when the client cancelled mid-stream.
  bool Download(const mirrorsync::v1::DownloadRequest& req, const agent::MirrorAgent::ChunkSink& sink, const std::function<bool()>& cancelled);

  mirrorsync::v1::ApplySyncResponse ApplySync(const std::string& bearer, const mirrorsync::v1::ApplySyncRequest& req);

  mirrorsync::v1::ListFilesResponse ListFiles(const std::string& bearer, const mirrorsync::v1::ListFilesRequest& req);

  mirrorsync::v1::ListLogResponse ListLog(const std::string& bearer, const mirrorsync::v1::ListLogRequest& req);

 private:
  std::shared_ptr<agent::MirrorAgent> agent_;
};

} // namespace mirrorsync::service
