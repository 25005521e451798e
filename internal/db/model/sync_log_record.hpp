#pragma once

#include <cstdint>
#include <string>

#include "mirrorsync/v1/types.pb.h"

namespace mirrorsync::db::model {

// Append-only. seq is assigned by the repository on insert.
struct SyncLogRecord {
  uint64_t    seq = 0;
  std::string mirror_id;
  std::string entry_id;

  mirrorsync::v1::SyncAction action = mirrorsync::v1::SYNC_ACTION_UNSPECIFIED;

  uint64_t    at_ms = 0;
  std::string detail;
};

} // namespace mirrorsync::db::model
