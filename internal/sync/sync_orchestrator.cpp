#include "internal/sync/sync_orchestrator.hpp"

#include <chrono>
#include <unordered_map>

#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/mirror_status.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/policy/priority_policy.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::sync {

using mirrorsync::observability::StringField;
using mirrorsync::observability::UintField;
using namespace mirrorsync::v1;

SyncDelta ComputeDelta(const std::vector<CatalogEntryRecord>& approved_catalog, size_t capacity,
                       const std::vector<db::model::MirrorFileRecord>& held) {
  std::unordered_set<std::string> held_ids;
  for (const auto& f : held) held_ids.insert(f.entry_id);

  SyncDelta                       delta;
  std::unordered_set<std::string> desired_ids;
  for (auto& entry : policy::Select(approved_catalog, capacity)) {
    desired_ids.insert(entry.id);
    if (held_ids.contains(entry.id)) {
      delta.retain.push_back(std::move(entry));
    } else {
      delta.fetch.push_back(std::move(entry));
    }
  }

  for (const auto& f : held) {
    if (!desired_ids.contains(f.entry_id)) delta.evict.push_back(f.entry_id);
  }
  return delta;
}

const char* OutcomeName(SyncPassOutcome outcome) {
  switch (outcome) {
    case SyncPassOutcome::kSkipped:
      return "skipped";
    case SyncPassOutcome::kUnchanged:
      return "unchanged";
    case SyncPassOutcome::kSynced:
      return "synced";
    case SyncPassOutcome::kUnreachable:
      return "unreachable";
  }
  return "unknown";
}

class SyncOrchestrator::InFlightGuard {
 public:
  InFlightGuard(SyncOrchestrator& owner, std::string mirror_id) : owner_(owner), mirror_id_(std::move(mirror_id)) {
    std::lock_guard lock(owner_.in_flight_mutex_);
    if (!owner_.in_flight_.insert(mirror_id_).second) {
      throw util::AlreadyRunning("sync pass: a pass for mirror " + mirror_id_ + " is already in flight");
    }
  }

  ~InFlightGuard() {
    std::lock_guard lock(owner_.in_flight_mutex_);
    owner_.in_flight_.erase(mirror_id_);
  }

  InFlightGuard(const InFlightGuard&)            = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

 private:
  SyncOrchestrator& owner_;
  std::string       mirror_id_;
};

SyncOrchestrator::SyncOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<MirrorTransport> transport,
                                   util::MillisClock clock)
    : repository_(std::move(repository)), transport_(std::move(transport)), clock_(std::move(clock)) {
}

bool SyncOrchestrator::InFlight(const std::string& mirror_id) const {
  std::lock_guard lock(in_flight_mutex_);
  return in_flight_.contains(mirror_id);
}

SyncPassReport SyncOrchestrator::RunPass(const std::string& mirror_id) {
  InFlightGuard guard(*this, mirror_id);

  observability::SpanScope span("SyncOrchestrator.RunPass");
  span.SetAttribute("mirror.id", mirror_id);
  const auto started_at = std::chrono::steady_clock::now();

  SyncPassReport report;
  report.mirror_id = mirror_id;

  auto finish = [&]() -> SyncPassReport {
    span.SetAttribute("sync.outcome", OutcomeName(report.outcome));
    observability::Metrics::Instance().ObserveSyncPassMs(
        OutcomeName(report.outcome), std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return std::move(report);
  };

  // Snapshot inputs; the network call happens outside any transaction.
  db::model::MirrorRecord              mirror;
  std::vector<CatalogEntryRecord>      catalog;
  std::vector<db::model::MirrorFileRecord> held;
  {
    auto tx     = repository_->Begin();
    auto record = repository_->GetMirror(*tx, mirror_id);
    if (!record) throw util::NotFound("sync pass: unknown mirror " + mirror_id);
    mirror = *record;
    if (model::IsSyncEligible(mirror.status)) {
      catalog = repository_->ListCatalogEntries(*tx, true);
      held    = repository_->ListMirrorFiles(*tx, mirror_id);
    }
    tx->Commit();
  }

  if (!model::IsSyncEligible(mirror.status)) {
    MIRRORSYNC_LOG_DEBUG("sync pass skipped", {StringField("mirror_id", mirror_id), StringField("status", model::StatusName(mirror.status))});
    report.outcome = SyncPassOutcome::kSkipped;
    return finish();
  }

  const auto delta = ComputeDelta(catalog, static_cast<size_t>(mirror.max_files), held);
  if (delta.Empty()) {
    report.outcome = SyncPassOutcome::kUnchanged;
    return finish();
  }

  ApplySyncRequest request;
  for (const auto& e : delta.fetch) *request.add_fetch() = model::ToProto(e);
  for (const auto& id : delta.evict) request.add_evict(id);
  for (const auto& e : delta.retain) *request.add_retain() = model::ToProto(e);

  MIRRORSYNC_LOG_INFO("sync instruction", {StringField("mirror_id", mirror_id), UintField("fetch", delta.fetch.size()),
                                           UintField("evict", delta.evict.size()), UintField("retain", delta.retain.size())});

  ApplySyncResponse response;
  try {
    response = transport_->ApplySync(mirror, request);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    RecordUnreachable(mirror_id, delta, e.what(), report);
    report.outcome = SyncPassOutcome::kUnreachable;
    return finish();
  }

  Reconcile(mirror_id, static_cast<size_t>(mirror.max_files), held, response, report);
  report.outcome = SyncPassOutcome::kSynced;

  MIRRORSYNC_LOG_INFO("sync pass done", {StringField("mirror_id", mirror_id), UintField("pushed", report.pushed),
                                         UintField("evicted", report.evicted), UintField("failed", report.failed)});
  return finish();
}

void SyncOrchestrator::Reconcile(const std::string& mirror_id, size_t capacity, const std::vector<db::model::MirrorFileRecord>& held,
                                 const ApplySyncResponse& response, SyncPassReport& report) {
  const uint64_t now = clock_();

  // The mirror's report is authoritative; clamp to capacity in case it is not.
  std::vector<CatalogEntryRecord> holdings;
  holdings.reserve(static_cast<size_t>(response.holdings_size()));
  for (const auto& h : response.holdings()) holdings.push_back(model::FromProto(h));
  holdings = policy::Select(std::move(holdings), capacity);

  std::unordered_set<std::string> holding_ids;
  for (const auto& h : holdings) holding_ids.insert(h.id);

  auto tx = repository_->Begin();

  for (const auto& outcome : response.outcomes()) {
    db::model::SyncLogRecord entry;
    entry.mirror_id = mirror_id;
    entry.entry_id  = outcome.entry_id();
    entry.action    = outcome.action();
    entry.at_ms     = now;
    entry.detail    = outcome.detail();
    db::ThrowIfDbError(repository_->AppendSyncLog(*tx, entry), "sync pass: append log");
    report.log.push_back(entry);

    switch (outcome.action()) {
      case SYNC_ACTION_PUSH:
        ++report.pushed;
        break;
      case SYNC_ACTION_EVICT:
        ++report.evicted;
        break;
      default:
        ++report.failed;
        MIRRORSYNC_LOG_WARN("sync item failed", {StringField("mirror_id", mirror_id), StringField("entry_id", outcome.entry_id()),
                                                 StringField("action", model::ActionName(outcome.action())),
                                                 StringField("detail", outcome.detail())});
        break;
    }
  }

  std::unordered_map<std::string, const db::model::MirrorFileRecord*> previous;
  for (const auto& f : held) previous.emplace(f.entry_id, &f);

  for (const auto& f : held) {
    if (!holding_ids.contains(f.entry_id)) {
      db::ThrowIfDbError(repository_->DeleteMirrorFile(*tx, mirror_id, f.entry_id), "sync pass: drop row");
    }
  }

  for (const auto& h : holdings) {
    db::model::MirrorFileRecord row;
    row.mirror_id      = mirror_id;
    row.entry_id       = h.id;
    row.state          = VERIFICATION_STATE_VERIFIED;
    row.size_bytes     = h.size_bytes;
    row.content_hash   = h.content_hash;
    row.popularity     = h.download_count;
    row.created_at_ms  = h.created_at_ms;
    auto it            = previous.find(h.id);
    row.synced_at_ms   = it != previous.end() ? it->second->synced_at_ms : now;
    db::ThrowIfDbError(repository_->UpsertMirrorFile(*tx, row), "sync pass: record holding");
  }

  // Re-read so a heartbeat that landed during the call is not overwritten.
  if (auto mirror = repository_->GetMirror(*tx, mirror_id)) {
    mirror->last_sync_ms = now;
    db::ThrowIfDbError(repository_->UpdateMirror(*tx, *mirror), "sync pass: stamp mirror");
  }
  tx->Commit();
}

void SyncOrchestrator::RecordUnreachable(const std::string& mirror_id, const SyncDelta& delta, const std::string& error,
                                         SyncPassReport& report) {
  MIRRORSYNC_LOG_WARN("mirror unreachable during sync", {StringField("mirror_id", mirror_id), StringField("error", error)});

  const uint64_t now = clock_();
  auto           tx  = repository_->Begin();
  for (const auto& e : delta.fetch) {
    db::model::SyncLogRecord entry;
    entry.mirror_id = mirror_id;
    entry.entry_id  = e.id;
    entry.action    = SYNC_ACTION_FETCH_FAIL;
    entry.at_ms     = now;
    entry.detail    = "unreachable: " + error;
    db::ThrowIfDbError(repository_->AppendSyncLog(*tx, entry), "sync pass: append log");
    report.log.push_back(entry);
    ++report.failed;
  }
  tx->Commit();
}

} // namespace mirrorsync::sync
