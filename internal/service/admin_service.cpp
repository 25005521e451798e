#include "internal/service/admin_service.hpp"

#include "internal/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pairing/pairing_service.hpp"
#include "internal/registry/mirror_registry.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/sync/sync_ticker.hpp"
#include "internal/util/time.hpp"

namespace mirrorsync::service {

using mirrorsync::observability::StringField;
using mirrorsync::observability::UintField;
using namespace mirrorsync::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)), auth_(ctx_.admin_token, ctx_.registry) {
}

IssuePairingCodeResponse AdminService::IssuePairingCode(const std::string& bearer, const IssuePairingCodeRequest&) {
  return ObserveRpc("AdminService.IssuePairingCode", "", [&] {
    auth_.RequireAdmin(bearer);

    const auto code = ctx_.pairing->IssueCode();

    IssuePairingCodeResponse resp;
    resp.set_code(code.code);
    *resp.mutable_expires_at() = util::MillisToProto(code.expires_at_ms);
    return resp;
  });
}

MirrorResponse AdminService::ApproveMirror(const std::string& bearer, const ApproveMirrorRequest& req) {
  return ObserveRpc("AdminService.ApproveMirror", req.mirror_id(), [&] {
    auth_.RequireAdmin(bearer);

    const auto mirror = ctx_.registry->Approve(req.mirror_id());
    ctx_.scheduler->Enqueue(mirror.id);
    MIRRORSYNC_LOG_INFO("mirror approved", {StringField("mirror_id", mirror.id), StringField("name", mirror.name)});

    MirrorResponse resp;
    *resp.mutable_mirror() = model::ToProto(mirror, ctx_.registry->HeldFiles(mirror.id));
    return resp;
  });
}

MirrorResponse AdminService::RejectMirror(const std::string& bearer, const RejectMirrorRequest& req) {
  return ObserveRpc("AdminService.RejectMirror", req.mirror_id(), [&] {
    auth_.RequireAdmin(bearer);

    const auto mirror = ctx_.registry->Reject(req.mirror_id());
    MIRRORSYNC_LOG_INFO("mirror rejected", {StringField("mirror_id", mirror.id), StringField("name", mirror.name)});

    MirrorResponse resp;
    *resp.mutable_mirror() = model::ToProto(mirror, 0);
    return resp;
  });
}

ListMirrorsResponse AdminService::ListMirrors(const std::string& bearer, const ListMirrorsRequest&) {
  return ObserveRpc("AdminService.ListMirrors", "", [&] {
    auth_.RequireAdmin(bearer);

    ListMirrorsResponse resp;
    for (const auto& mirror : ctx_.registry->List()) {
      *resp.add_mirrors() = model::ToProto(mirror, ctx_.registry->HeldFiles(mirror.id));
    }
    return resp;
  });
}

ListSyncLogResponse AdminService::ListSyncLog(const std::string& bearer, const ListSyncLogRequest& req) {
  return ObserveRpc("AdminService.ListSyncLog", req.mirror_id(), [&] {
    auth_.RequireAdmin(bearer);

    ListSyncLogResponse resp;
    for (const auto& entry : ctx_.registry->SyncLog(req.mirror_id(), req.limit())) {
      *resp.add_entries() = model::ToProto(entry);
    }
    return resp;
  });
}

NotifyCatalogChangedResponse AdminService::NotifyCatalogChanged(const std::string& bearer, const NotifyCatalogChangedRequest&) {
  return ObserveRpc("AdminService.NotifyCatalogChanged", "", [&] {
    auth_.RequireAdmin(bearer);

    NotifyCatalogChangedResponse resp;
    if (!ctx_.sync_on_catalog_change) {
      MIRRORSYNC_LOG_DEBUG("catalog change ignored; sync_on_catalog_change is off");
      return resp;
    }
    resp.set_mirrors_queued(static_cast<uint32_t>(ctx_.ticker->EnqueueEligible()));
    MIRRORSYNC_LOG_INFO("catalog changed", {UintField("mirrors_queued", resp.mirrors_queued())});
    return resp;
  });
}

} // namespace mirrorsync::service
