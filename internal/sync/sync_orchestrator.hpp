#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/model/catalog_entry_record.hpp"
#include "internal/db/model/mirror_file_record.hpp"
#include "internal/db/model/sync_log_record.hpp"
#include "internal/sync/mirror_transport.hpp"
#include "internal/util/time.hpp"

namespace mirrorsync::db {
class Repository;
}

namespace mirrorsync::sync {

using db::model::CatalogEntryRecord;

// What one pass needs to change on a mirror.
struct SyncDelta {
  std::vector<CatalogEntryRecord> fetch;  // desired, not held; rank order
  std::vector<std::string>        evict;  // held, not desired
  std::vector<CatalogEntryRecord> retain; // desired and held

  bool Empty() const {
    return fetch.empty() && evict.empty();
  }
};

// desired = top `capacity` of the approved catalog; held = the mirror's rows.
SyncDelta ComputeDelta(const std::vector<CatalogEntryRecord>& approved_catalog, size_t capacity,
                       const std::vector<db::model::MirrorFileRecord>& held);

enum class SyncPassOutcome {
  kSkipped,     // not approved/online
  kUnchanged,   // empty delta, nothing sent
  kSynced,
  kUnreachable, // instruction never landed
};

const char* OutcomeName(SyncPassOutcome outcome);

struct SyncPassReport {
  std::string     mirror_id;
  SyncPassOutcome outcome = SyncPassOutcome::kSkipped;

  size_t pushed  = 0;
  size_t evicted = 0;
  size_t failed  = 0;

  std::vector<db::model::SyncLogRecord> log;
};

/*
  Computes each mirror's desired set and pushes the delta.

  At most one pass per mirror runs at a time; a second concurrent RunPass
  for the same mirror throws AlreadyRunning. Passes for different mirrors
  are independent. Transport failures never escape: they become fetch-fail
  log entries and are retried by the next pass.
*/
class SyncOrchestrator {
 public:
  SyncOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<MirrorTransport> transport,
                   util::MillisClock clock = util::NowMillis);

  SyncPassReport RunPass(const std::string& mirror_id);

  bool InFlight(const std::string& mirror_id) const;

 private:
  class InFlightGuard;

  void Reconcile(const std::string& mirror_id, size_t capacity, const std::vector<db::model::MirrorFileRecord>& held,
                 const mirrorsync::v1::ApplySyncResponse& response, SyncPassReport& report);

  void RecordUnreachable(const std::string& mirror_id, const SyncDelta& delta, const std::string& error, SyncPassReport& report);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<MirrorTransport> transport_;
  util::MillisClock                clock_;

  mutable std::mutex              in_flight_mutex_;
  std::unordered_set<std::string> in_flight_;
};

} // namespace mirrorsync::sync
