#include "internal/heartbeat/heartbeat_monitor.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/mirror_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::heartbeat {

using mirrorsync::observability::StringField;
using mirrorsync::observability::UintField;
using namespace mirrorsync::v1;

HeartbeatMonitor::HeartbeatMonitor(std::shared_ptr<db::Repository> repository, HeartbeatOptions options, util::MillisClock clock)
    : repository_(std::move(repository)), options_(options), clock_(std::move(clock)) {
}

std::pair<std::string, MirrorStatus> HeartbeatMonitor::RecordHeartbeat(const std::string& credential, const MirrorCounters& counters) {
  auto tx     = repository_->Begin();
  auto mirror = repository_->FindMirrorByCredential(*tx, credential);
  if (!mirror) throw util::Unauthenticated("heartbeat: unknown mirror credential");

  if (!model::TracksHeartbeat(mirror->status)) {
    throw util::InvalidState("heartbeat: mirror is " + std::string(model::StatusName(mirror->status)) + " and not tracked");
  }

  const auto previous       = mirror->status;
  mirror->status            = MIRROR_STATUS_ONLINE;
  mirror->last_heartbeat_ms = clock_();
  mirror->reported_files    = counters.file_count();
  // The node's configured capacity wins over the one declared at pairing.
  if (counters.max_files() > 0 && counters.max_files() != mirror->max_files) {
    MIRRORSYNC_LOG_INFO("mirror capacity changed", {StringField("mirror_id", mirror->id), UintField("from", mirror->max_files),
                                                    UintField("to", counters.max_files())});
    mirror->max_files = counters.max_files();
  }
  db::ThrowIfDbError(repository_->UpdateMirror(*tx, *mirror), "heartbeat");
  tx->Commit();

  if (previous != MIRROR_STATUS_ONLINE) {
    MIRRORSYNC_LOG_INFO("mirror online", {StringField("mirror_id", mirror->id), StringField("from", model::StatusName(previous))});
  }
  return {mirror->id, mirror->status};
}

std::vector<std::string> HeartbeatMonitor::Sweep(uint64_t now_ms) {
  const auto timeout_ms = static_cast<uint64_t>(options_.EffectiveTimeout().count());

  std::vector<std::string> went_offline;

  auto tx = repository_->Begin();
  for (auto& mirror : repository_->ListMirrors(*tx)) {
    if (mirror.status != MIRROR_STATUS_ONLINE) continue;
    if (now_ms < mirror.last_heartbeat_ms + timeout_ms) continue;

    mirror.status = MIRROR_STATUS_OFFLINE;
    db::ThrowIfDbError(repository_->UpdateMirror(*tx, mirror), "heartbeat sweep");
    went_offline.push_back(mirror.id);
  }
  tx->Commit();

  for (const auto& id : went_offline) {
    MIRRORSYNC_LOG_WARN("mirror offline: heartbeat timeout", {StringField("mirror_id", id), UintField("timeout_ms", timeout_ms)});
  }
  return went_offline;
}

std::vector<std::string> HeartbeatMonitor::Sweep() {
  return Sweep(clock_());
}

} // namespace mirrorsync::heartbeat
