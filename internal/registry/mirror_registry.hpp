#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/mirror_record.hpp"
#include "internal/db/model/sync_log_record.hpp"

namespace mirrorsync::db {
class Repository;
}

namespace mirrorsync::registry {

struct MirrorStatusView {
  db::model::MirrorRecord            mirror;
  uint64_t                           held_files = 0;
  std::vector<db::model::SyncLogRecord> recent_log;
};

/*
  Origin-side view over the mirror table.

  Admin decisions (approve/reject) land here; liveness changes belong to
  the HeartbeatMonitor. Every status change is checked against
  model::CanTransition.
*/
class MirrorRegistry {
 public:
  explicit MirrorRegistry(std::shared_ptr<db::Repository> repository);

  // Throws NotFound.
  db::model::MirrorRecord Get(const std::string& id) const;

  std::vector<db::model::MirrorRecord> List() const;

  std::optional<db::model::MirrorRecord> FindByCredential(const std::string& credential) const;

  // pending -> approved. InvalidState from any other status.
  db::model::MirrorRecord Approve(const std::string& id);

  // pending -> rejected. InvalidState from any other status.
  db::model::MirrorRecord Reject(const std::string& id);

  MirrorStatusView Status(const std::string& id, uint64_t log_limit) const;

  uint64_t HeldFiles(const std::string& id) const;

  std::vector<db::model::SyncLogRecord> SyncLog(const std::string& id, uint64_t limit) const;

 private:
  db::model::MirrorRecord Decide(const std::string& id, mirrorsync::v1::MirrorStatus to, const char* action);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace mirrorsync::registry
