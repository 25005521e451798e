#include "internal/service/origin_service.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/model/mirror_status.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/pairing/pairing_service.hpp"
#include "internal/registry/mirror_registry.hpp"
#include "internal/routing/download_router.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/content_store.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::service {

using namespace mirrorsync::v1;

namespace {

constexpr uint64_t kStatusLogLimit = 20;

} // namespace

OriginService::OriginService(ServiceContext ctx) : ctx_(std::move(ctx)), auth_(ctx_.admin_token, ctx_.registry) {
}

RedeemResponse OriginService::Redeem(const RedeemRequest& req) {
  return ObserveRpc("OriginService.Redeem", "", [&] {
    pairing::RedeemRequest request;
    request.code        = req.pairing_code();
    request.mirror_name = req.mirror_name();
    request.direct_url  = req.direct_url();
    request.tunnel_url  = req.tunnel_url();
    request.max_files   = req.max_files();

    const auto result = ctx_.pairing->Redeem(request);

    RedeemResponse resp;
    resp.set_mirror_id(result.mirror_id);
    resp.set_credential(result.credential);
    return resp;
  });
}

HeartbeatResponse OriginService::Heartbeat(const std::string& bearer, const HeartbeatRequest& req) {
  return ObserveRpc("OriginService.Heartbeat", "", [&] {
    if (bearer.empty()) {
      throw util::Unauthenticated("heartbeat: mirror credential required");
    }
    const auto [mirror_id, status] = ctx_.heartbeat->RecordHeartbeat(bearer, req.counters());

    HeartbeatResponse resp;
    resp.set_status(status);
    return resp;
  });
}

void OriginService::FetchContent(const std::string& bearer, const FetchContentRequest& req, const ChunkSink& sink) {
  ObserveRpc("OriginService.FetchContent", "", [&] {
    const auto mirror = auth_.RequireMirror(bearer);
    if (!model::IsSyncEligible(mirror.status)) {
      throw util::InvalidState("fetch content: mirror " + mirror.id + " is " + std::string(model::StatusName(mirror.status)) +
                               "; only approved mirrors receive content");
    }

    std::optional<db::model::CatalogEntryRecord> entry;
    {
      auto tx = ctx_.repository->Begin();
      entry   = ctx_.repository->GetCatalogEntry(*tx, req.entry_id());
      tx->Commit();
    }
    if (!entry || !entry->approved) {
      throw util::NotFound("fetch content: no approved catalog entry " + req.entry_id());
    }

    auto           file   = ctx_.archive->Open(entry->filename.empty() ? entry->id : entry->filename);
    const uint64_t total  = static_cast<uint64_t>(storage::common::Unwrap(file->GetSize()));
    uint64_t       offset = 0;
    while (offset < total) {
      const auto want   = static_cast<int64_t>(std::min<uint64_t>(kContentChunkBytes, total - offset));
      auto       buffer = storage::common::Unwrap(file->ReadAt(static_cast<int64_t>(offset), want));
      if (buffer->size() == 0) break;
      if (!sink(buffer->data(), static_cast<size_t>(buffer->size()), offset, total)) return;
      offset += static_cast<uint64_t>(buffer->size());
    }
  });
}

GetMirrorStatusResponse OriginService::GetMirrorStatus(const std::string& bearer, const GetMirrorStatusRequest& req) {
  return ObserveRpc("OriginService.GetMirrorStatus", req.mirror_id(), [&] {
    auth_.RequireAdminOrMirror(bearer, req.mirror_id());

    const auto view = ctx_.registry->Status(req.mirror_id(), kStatusLogLimit);

    GetMirrorStatusResponse resp;
    *resp.mutable_mirror() = model::ToProto(view.mirror, view.held_files);
    for (const auto& entry : view.recent_log) *resp.add_recent_log() = model::ToProto(entry);
    return resp;
  });
}

TriggerSyncResponse OriginService::TriggerSync(const std::string& bearer, const TriggerSyncRequest& req) {
  return ObserveRpc("OriginService.TriggerSync", req.mirror_id(), [&] {
    auth_.RequireAdminOrMirror(bearer, req.mirror_id());

    const auto mirror = ctx_.registry->Get(req.mirror_id());
    if (!model::IsSyncEligible(mirror.status)) {
      throw util::InvalidState("trigger sync: mirror " + mirror.id + " is " + std::string(model::StatusName(mirror.status)) +
                               "; only approved or online mirrors sync");
    }

    TriggerSyncResponse resp;
    const auto          queued = ctx_.scheduler->Enqueue(mirror.id);
    resp.set_accepted(true);
    resp.set_already_pending(queued == sync::SyncScheduler::EnqueueResult::kAlreadyPending);
    return resp;
  });
}

ResolveDownloadResponse OriginService::ResolveDownload(const ResolveDownloadRequest& req) {
  return ObserveRpc("OriginService.ResolveDownload", "", [&] {
    const auto route = ctx_.router->Resolve(req.entry_id());

    ResolveDownloadResponse resp;
    resp.set_url(route.url);
    resp.set_mirror_id(route.mirror_id);
    resp.set_fallback(route.fallback);
    return resp;
  });
}

} // namespace mirrorsync::service
