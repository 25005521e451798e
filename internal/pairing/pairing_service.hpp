#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/model/pairing_code_record.hpp"
#include "internal/util/time.hpp"

namespace mirrorsync::db {
class Repository;
}

namespace mirrorsync::pairing {

struct PairingOptions {
  std::chrono::milliseconds code_ttl{std::chrono::minutes(15)};
  uint32_t                  max_outstanding_codes = 10;
  uint32_t                  code_length           = 8;
};

struct RedeemRequest {
  std::string code;
  std::string mirror_name;
  std::string direct_url;
  std::string tunnel_url;
  uint64_t    max_files = 0;
};

struct RedeemResult {
  std::string mirror_id;
  std::string credential;
};

/*
  Admits new mirrors.

  A code is single use: redemption marks it consumed and creates the pending
  mirror in the same transaction, so two concurrent redemptions of one code
  produce exactly one mirror. Failures are distinct exception types
  (InvalidCode, AlreadyConsumed, ExpiredCode) so callers can tell the
  operator what to do.
*/
class PairingService {
 public:
  PairingService(std::shared_ptr<db::Repository> repository, PairingOptions options, util::MillisClock clock = util::NowMillis);

  // Throws RateLimited once max_outstanding_codes are live.
  db::model::PairingCodeRecord IssueCode();

  RedeemResult Redeem(const RedeemRequest& request);

  // Deletes expired codes. Returns how many were removed.
  uint64_t CollectExpired();

 private:
  std::shared_ptr<db::Repository> repository_;
  PairingOptions                  options_;
  util::MillisClock               clock_;
};

} // namespace mirrorsync::pairing
