#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/agent/origin_link.hpp"
#include "mirrorsync/v1/admin_service.grpc.pb.h"
#include "mirrorsync/v1/origin_service.grpc.pb.h"

namespace mirrorsync::client {

/*
  Blocking client for the origin's OriginService and MirrorAdminService.

  Every call carries a deadline. Failures are raised as the util exception
  the server reported; transport failures and deadlines as util::Unreachable.
*/
class OriginClient final : public agent::OriginLink {
 public:
  OriginClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds rpc_timeout, std::chrono::milliseconds fetch_timeout);

  // OriginLink
  mirrorsync::v1::RedeemResponse Redeem(const mirrorsync::v1::RedeemRequest& request) override;
  mirrorsync::v1::MirrorStatus   Heartbeat(const std::string& credential, const mirrorsync::v1::MirrorCounters& counters) override;
  void FetchContent(const std::string& credential, const std::string& entry_id, const std::function<void(std::string_view chunk)>& sink) override;
  mirrorsync::v1::TriggerSyncResponse TriggerSync(const std::string& token, const std::string& mirror_id) override;

  mirrorsync::v1::GetMirrorStatusResponse GetMirrorStatus(const std::string& token, const std::string& mirror_id) const;
  mirrorsync::v1::ResolveDownloadResponse ResolveDownload(const std::string& entry_id) const;

  // admin surface; token is the admin token
  mirrorsync::v1::IssuePairingCodeResponse     IssuePairingCode(const std::string& token) const;
  mirrorsync::v1::MirrorResponse               ApproveMirror(const std::string& token, const std::string& mirror_id) const;
  mirrorsync::v1::MirrorResponse               RejectMirror(const std::string& token, const std::string& mirror_id) const;
  mirrorsync::v1::ListMirrorsResponse          ListMirrors(const std::string& token) const;
  mirrorsync::v1::ListSyncLogResponse          ListSyncLog(const std::string& token, const std::string& mirror_id, uint32_t limit) const;
  mirrorsync::v1::NotifyCatalogChangedResponse NotifyCatalogChanged(const std::string& token) const;

 private:
  std::unique_ptr<mirrorsync::v1::OriginService::Stub>      origin_stub_;
  std::unique_ptr<mirrorsync::v1::MirrorAdminService::Stub> admin_stub_;
  std::chrono::milliseconds                                 rpc_timeout_;
  std::chrono::milliseconds                                 fetch_timeout_;
};

} // namespace mirrorsync::client
