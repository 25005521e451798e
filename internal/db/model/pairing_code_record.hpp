#pragma once

#include <cstdint>
#include <string>

namespace mirrorsync::db::model {

struct PairingCodeRecord {
  std::string code;

  uint64_t issued_at_ms  = 0;
  uint64_t expires_at_ms = 0;

  bool        consumed = false;
  std::string mirror_id; // set on redemption
};

} // namespace mirrorsync::db::model
