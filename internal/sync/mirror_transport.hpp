#pragma once

#include "internal/db/model/mirror_record.hpp"
#include "mirrorsync/v1/mirror_service.pb.h"

namespace mirrorsync::sync {

/*
  Delivers one sync instruction to a mirror and returns its report.

  Implementations throw util::Unreachable for network failures and
  deadlines; anything else the mirror rejects surfaces as its mapped
  util exception.
*/
class MirrorTransport {
 public:
  virtual ~MirrorTransport() = default;

  virtual mirrorsync::v1::ApplySyncResponse ApplySync(const db::model::MirrorRecord& mirror, const mirrorsync::v1::ApplySyncRequest& request) = 0;
};

} // namespace mirrorsync::sync
