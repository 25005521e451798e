#include "internal/service/mirror_service.hpp"

#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::service {

using namespace mirrorsync::v1;

MirrorService::MirrorService(std::shared_ptr<agent::MirrorAgent> agent) : agent_(std::move(agent)) {
}

HealthResponse MirrorService::Health(const HealthRequest&) {
  return ObserveRpc("MirrorService.Health", "", [&] { return agent_->Health(); });
}

PairResponse MirrorService::Pair(const PairRequest& req) {
  return ObserveRpc("MirrorService.Pair", "", [&] { return agent_->Pair(req.pairing_code(), req.direct_url(), req.tunnel_url()); });
}

bool MirrorService::Download(const DownloadRequest& req, const agent::MirrorAgent::ChunkSink& sink, const std::function<bool()>& cancelled) {
  return ObserveRpc("MirrorService.Download", agent_->MirrorId(), [&] {
    if (req.entry_id().empty()) {
      throw util::InvalidArgument("download: entry_id is required");
    }
    return agent_->ServeDownload(req.entry_id(), sink, cancelled);
  });
}

ApplySyncResponse MirrorService::ApplySync(const std::string& bearer, const ApplySyncRequest& req) {
  return ObserveRpc("MirrorService.ApplySync", agent_->MirrorId(), [&] { return agent_->ApplySync(bearer, req); });
}

ListFilesResponse MirrorService::ListFiles(const std::string& bearer, const ListFilesRequest&) {
  return ObserveRpc("MirrorService.ListFiles", agent_->MirrorId(), [&] { return agent_->ListFiles(bearer); });
}

ListLogResponse MirrorService::ListLog(const std::string& bearer, const ListLogRequest& req) {
  return ObserveRpc("MirrorService.ListLog", agent_->MirrorId(), [&] { return agent_->ListLog(bearer, req.limit()); });
}

} // namespace mirrorsync::service
