#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "mirrorsync/v1/origin_service.pb.h"

namespace mirrorsync::agent {

/*
  The agent's view of the origin.

  Every call blocks with a deadline; network failures and timeouts throw
  util::Unreachable, refusals throw the mapped util exception.
*/
class OriginLink {
 public:
  virtual ~OriginLink() = default;

  virtual mirrorsync::v1::RedeemResponse Redeem(const mirrorsync::v1::RedeemRequest& request) = 0;

  virtual mirrorsync::v1::MirrorStatus Heartbeat(const std::string& credential, const mirrorsync::v1::MirrorCounters& counters) = 0;

  // Calls sink once per chunk, in order.
  virtual void FetchContent(const std::string& credential, const std::string& entry_id,
                            const std::function<void(std::string_view chunk)>& sink) = 0;

  virtual mirrorsync::v1::TriggerSyncResponse TriggerSync(const std::string& credential, const std::string& mirror_id) = 0;
};

} // namespace mirrorsync::agent
