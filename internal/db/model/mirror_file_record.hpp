#pragma once

#include <cstdint>
#include <string>

#include "mirrorsync/v1/types.pb.h"

namespace mirrorsync::db::model {

/*
  "mirror_id holds entry_id".

  The origin only relies on the first four fields. A mirror agent keeps the
  rest so it can rank and serve its own holdings without the catalog.
*/

struct MirrorFileRecord {
  std::string mirror_id;
  std::string entry_id;

  mirrorsync::v1::VerificationState state = mirrorsync::v1::VERIFICATION_STATE_UNVERIFIED;

  uint64_t synced_at_ms = 0;

  uint64_t    size_bytes = 0;
  std::string content_hash;
  uint64_t    popularity    = 0; // catalog download count when last seen
  uint64_t    created_at_ms = 0; // catalog creation time
  uint64_t    download_count = 0; // served by this mirror
};

} // namespace mirrorsync::db::model
