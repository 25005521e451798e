#include "internal/registry/mirror_registry.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/mirror_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mirrorsync::registry {

using mirrorsync::observability::StringField;

MirrorRegistry::MirrorRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::MirrorRecord MirrorRegistry::Get(const std::string& id) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetMirror(*tx, id);
  tx->Commit();
  if (!record) throw util::NotFound("get mirror: unknown mirror " + id);
  return *record;
}

std::vector<db::model::MirrorRecord> MirrorRegistry::List() const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListMirrors(*tx);
  tx->Commit();
  return records;
}

std::optional<db::model::MirrorRecord> MirrorRegistry::FindByCredential(const std::string& credential) const {
  auto tx     = repository_->Begin();
  auto record = repository_->FindMirrorByCredential(*tx, credential);
  tx->Commit();
  return record;
}

db::model::MirrorRecord MirrorRegistry::Approve(const std::string& id) {
  return Decide(id, mirrorsync::v1::MIRROR_STATUS_APPROVED, "approve mirror");
}

db::model::MirrorRecord MirrorRegistry::Reject(const std::string& id) {
  return Decide(id, mirrorsync::v1::MIRROR_STATUS_REJECTED, "reject mirror");
}

db::model::MirrorRecord MirrorRegistry::Decide(const std::string& id, mirrorsync::v1::MirrorStatus to, const char* action) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetMirror(*tx, id);
  if (!record) throw util::NotFound(std::string(action) + ": unknown mirror " + id);

  // only a pending mirror awaits a decision; re-approving is not a no-op
  if (record->status != mirrorsync::v1::MIRROR_STATUS_PENDING || !model::CanTransition(record->status, to)) {
    throw util::InvalidState(std::string(action) + ": mirror is " + std::string(model::StatusName(record->status)) +
                             ", only pending mirrors can be decided");
  }

  record->status = to;
  db::ThrowIfDbError(repository_->UpdateMirror(*tx, *record), action);
  tx->Commit();

  MIRRORSYNC_LOG_INFO("mirror decided", {StringField("mirror_id", id), StringField("status", model::StatusName(to))});
  return *record;
}

uint64_t MirrorRegistry::HeldFiles(const std::string& id) const {
  auto tx    = repository_->Begin();
  auto files = repository_->ListMirrorFiles(*tx, id);
  tx->Commit();

  uint64_t held = 0;
  for (const auto& f : files) {
    if (f.state == mirrorsync::v1::VERIFICATION_STATE_VERIFIED) ++held;
  }
  return held;
}

MirrorStatusView MirrorRegistry::Status(const std::string& id, uint64_t log_limit) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetMirror(*tx, id);
  if (!record) throw util::NotFound("mirror status: unknown mirror " + id);

  MirrorStatusView view;
  view.mirror = *record;
  for (const auto& f : repository_->ListMirrorFiles(*tx, id)) {
    if (f.state == mirrorsync::v1::VERIFICATION_STATE_VERIFIED) ++view.held_files;
  }
  view.recent_log = repository_->ListSyncLog(*tx, id, log_limit);
  tx->Commit();
  return view;
}

std::vector<db::model::SyncLogRecord> MirrorRegistry::SyncLog(const std::string& id, uint64_t limit) const {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListSyncLog(*tx, id, limit);
  tx->Commit();
  return entries;
}

} // namespace mirrorsync::registry
