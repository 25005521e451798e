#pragma once

#include <string>

#include "internal/service/authorizer.hpp"
#include "internal/service/service_context.hpp"
#include "mirrorsync/v1/admin_service.pb.h"

namespace mirrorsync::service {

// Operator actions. Every call requires the admin token.
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  mirrorsync::v1::IssuePairingCodeResponse IssuePairingCode(const std::string& bearer, const mirrorsync::v1::IssuePairingCodeRequest& req);

  // An approved mirror is queued for its first sync pass.
  mirrorsync::v1::MirrorResponse ApproveMirror(const std::string& bearer, const mirrorsync::v1::ApproveMirrorRequest& req);

  mirrorsync::v1::MirrorResponse RejectMirror(const std::string& bearer, const mirrorsync::v1::RejectMirrorRequest& req);

  mirrorsync::v1::ListMirrorsResponse ListMirrors(const std::string& bearer, const mirrorsync::v1::ListMirrorsRequest& req);

  mirrorsync::v1::ListSyncLogResponse ListSyncLog(const std::string& bearer, const mirrorsync::v1::ListSyncLogRequest& req);

  mirrorsync::v1::NotifyCatalogChangedResponse NotifyCatalogChanged(const std::string& bearer,
                                                                    const mirrorsync::v1::NotifyCatalogChangedRequest& req);

 private:
  ServiceContext ctx_;
  Authorizer     auth_;
};

} // namespace mirrorsync::service
