#pragma once

#include <cstdint>
#include <string>

#include "mirrorsync/v1/types.pb.h"

namespace mirrorsync::db::model {

/*
  Persistent mirror row (the Registry).

  - credential is unique and never rewritten after insert.
  - status moves only along model::CanTransition.
*/

struct MirrorRecord {
  std::string id;
  std::string name;

  mirrorsync::v1::MirrorStatus status = mirrorsync::v1::MIRROR_STATUS_PENDING;

  std::string credential;
  std::string direct_url;
  std::string tunnel_url; // empty = no tunnel

  uint64_t max_files = 0;

  // 0 = never
  uint64_t last_heartbeat_ms = 0;
  uint64_t created_at_ms     = 0;
  uint64_t last_sync_ms      = 0;

  // file count the mirror itself reported on its last heartbeat
  uint64_t reported_files = 0;
};

} // namespace mirrorsync::db::model
