#pragma once

#include <string_view>

#include "mirrorsync/v1/types.pb.h"

namespace mirrorsync::model {

using mirrorsync::v1::MirrorStatus;

constexpr bool IsTerminal(MirrorStatus status) {
  return status == mirrorsync::v1::MIRROR_STATUS_REJECTED;
}

// Mirrors that may receive sync instructions.
constexpr bool IsSyncEligible(MirrorStatus status) {
  return status == mirrorsync::v1::MIRROR_STATUS_APPROVED || status == mirrorsync::v1::MIRROR_STATUS_ONLINE;
}

// Mirrors whose heartbeats are accepted.
constexpr bool TracksHeartbeat(MirrorStatus status) {
  return status == mirrorsync::v1::MIRROR_STATUS_APPROVED || status == mirrorsync::v1::MIRROR_STATUS_ONLINE ||
         status == mirrorsync::v1::MIRROR_STATUS_OFFLINE;
}

/*
  pending  -> approved | rejected
  approved -> online | offline
  online  <-> offline
  rejected is final
*/
constexpr bool CanTransition(MirrorStatus from, MirrorStatus to) {
  using namespace mirrorsync::v1;

  if (from == to) {
    return from != MIRROR_STATUS_UNSPECIFIED;
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case MIRROR_STATUS_PENDING:
      return to == MIRROR_STATUS_APPROVED || to == MIRROR_STATUS_REJECTED;
    case MIRROR_STATUS_APPROVED:
      return to == MIRROR_STATUS_ONLINE || to == MIRROR_STATUS_OFFLINE;
    case MIRROR_STATUS_ONLINE:
      return to == MIRROR_STATUS_OFFLINE;
    case MIRROR_STATUS_OFFLINE:
      return to == MIRROR_STATUS_ONLINE;
    default:
      return false;
  }
}

constexpr std::string_view StatusName(MirrorStatus status) {
  switch (status) {
    case mirrorsync::v1::MIRROR_STATUS_PENDING:
      return "pending";
    case mirrorsync::v1::MIRROR_STATUS_APPROVED:
      return "approved";
    case mirrorsync::v1::MIRROR_STATUS_ONLINE:
      return "online";
    case mirrorsync::v1::MIRROR_STATUS_OFFLINE:
      return "offline";
    case mirrorsync::v1::MIRROR_STATUS_REJECTED:
      return "rejected";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ActionName(mirrorsync::v1::SyncAction action) {
  switch (action) {
    case mirrorsync::v1::SYNC_ACTION_PUSH:
      return "push";
    case mirrorsync::v1::SYNC_ACTION_EVICT:
      return "evict";
    case mirrorsync::v1::SYNC_ACTION_VERIFY_FAIL:
      return "verify-fail";
    case mirrorsync::v1::SYNC_ACTION_FETCH_FAIL:
      return "fetch-fail";
    default:
      return "unspecified";
  }
}

} // namespace mirrorsync::model
