#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace mirrorsync::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Mirrors
// ------------------------------------------------------------------

Result MemoryRepository::InsertMirror(Transaction& t, const model::MirrorRecord& r) {
  const auto& view = TX(t).View();
  if (view.mirrors.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "mirror " + r.id);
  for (const auto& [_, existing] : view.mirrors) {
    if (existing.credential == r.credential) return Result::Err(ErrorCode::ConstraintViolation, "duplicate credential");
  }
  TX(t).Mutable().mirrors[r.id] = r;
  return Result::Ok();
}

std::optional<model::MirrorRecord> MemoryRepository::GetMirror(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.mirrors.find(id);
  if (it == s.mirrors.end()) return std::nullopt;
  return it->second;
}

std::optional<model::MirrorRecord> MemoryRepository::FindMirrorByCredential(Transaction& t, const std::string& credential) {
  if (credential.empty()) return std::nullopt;
  for (const auto& [_, mirror] : TX(t).View().mirrors) {
    if (mirror.credential == credential) return mirror;
  }
  return std::nullopt;
}

std::vector<model::MirrorRecord> MemoryRepository::ListMirrors(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::MirrorRecord> records;
  records.reserve(s.mirrors.size());
  for (const auto& [_, record] : s.mirrors) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::UpdateMirror(Transaction& t, const model::MirrorRecord& r) {
  if (!TX(t).View().mirrors.contains(r.id)) return Result::Err(ErrorCode::NotFound, "mirror " + r.id);
  auto& stored      = TX(t).Mutable().mirrors[r.id];
  const auto secret = stored.credential;
  stored            = r;
  stored.credential = secret;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Pairing codes
// ------------------------------------------------------------------

Result MemoryRepository::InsertPairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  if (TX(t).View().pairing_codes.contains(r.code)) return Result::Err(ErrorCode::AlreadyExists, "pairing code");
  TX(t).Mutable().pairing_codes[r.code] = r;
  return Result::Ok();
}

std::optional<model::PairingCodeRecord> MemoryRepository::GetPairingCode(Transaction& t, const std::string& code) {
  const auto& s  = TX(t).View();
  auto        it = s.pairing_codes.find(code);
  if (it == s.pairing_codes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdatePairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  if (!TX(t).View().pairing_codes.contains(r.code)) return Result::Err(ErrorCode::NotFound, "pairing code");
  TX(t).Mutable().pairing_codes[r.code] = r;
  return Result::Ok();
}

uint64_t MemoryRepository::CountOutstandingPairingCodes(Transaction& t, uint64_t now_ms) {
  uint64_t count = 0;
  for (const auto& [_, code] : TX(t).View().pairing_codes) {
    if (!code.consumed && code.expires_at_ms > now_ms) ++count;
  }
  return count;
}

uint64_t MemoryRepository::DeleteExpiredPairingCodes(Transaction& t, uint64_t now_ms) {
  uint64_t removed = 0;
  for (const auto& [_, code] : TX(t).View().pairing_codes) {
    if (!code.consumed && code.expires_at_ms <= now_ms) ++removed;
  }
  if (removed == 0) return 0;

  std::erase_if(TX(t).Mutable().pairing_codes, [now_ms](const auto& kv) { return !kv.second.consumed && kv.second.expires_at_ms <= now_ms; });
  return removed;
}

// ------------------------------------------------------------------
// Mirror files
// ------------------------------------------------------------------

Result MemoryRepository::UpsertMirrorFile(Transaction& t, const model::MirrorFileRecord& r) {
  TX(t).Mutable().mirror_files[{r.mirror_id, r.entry_id}] = r;
  return Result::Ok();
}

std::optional<model::MirrorFileRecord> MemoryRepository::GetMirrorFile(Transaction& t, const std::string& mirror_id,
                                                                       const std::string& entry_id) {
  const auto& s  = TX(t).View();
  auto        it = s.mirror_files.find({mirror_id, entry_id});
  if (it == s.mirror_files.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MirrorFileRecord> MemoryRepository::ListMirrorFiles(Transaction& t, const std::string& mirror_id) {
  const auto&                          s = TX(t).View();
  std::vector<model::MirrorFileRecord> out;
  for (auto it = s.mirror_files.lower_bound({mirror_id, std::string{}}); it != s.mirror_files.end() && it->first.first == mirror_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::vector<model::MirrorFileRecord> MemoryRepository::ListHoldersOf(Transaction& t, const std::string& entry_id) {
  std::vector<model::MirrorFileRecord> out;
  for (const auto& [key, record] : TX(t).View().mirror_files) {
    if (key.second == entry_id) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteMirrorFile(Transaction& t, const std::string& mirror_id, const std::string& entry_id) {
  if (!TX(t).View().mirror_files.contains({mirror_id, entry_id})) return Result::Ok();
  TX(t).Mutable().mirror_files.erase({mirror_id, entry_id});
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sync log
// ------------------------------------------------------------------

Result MemoryRepository::AppendSyncLog(Transaction& t, model::SyncLogRecord& r) {
  auto& s = TX(t).Mutable();
  r.seq   = s.next_log_seq++;
  s.sync_log.push_back(r);
  return Result::Ok();
}

std::vector<model::SyncLogRecord> MemoryRepository::ListSyncLog(Transaction& t, const std::string& mirror_id, uint64_t limit) {
  const auto&                       s = TX(t).View();
  std::vector<model::SyncLogRecord> out;
  for (auto it = s.sync_log.rbegin(); it != s.sync_log.rend(); ++it) {
    if (!mirror_id.empty() && it->mirror_id != mirror_id) continue;
    out.push_back(*it);
    if (limit != 0 && out.size() >= limit) break;
  }
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCatalogEntry(Transaction& t, const model::CatalogEntryRecord& r) {
  TX(t).Mutable().catalog[r.id] = r;
  return Result::Ok();
}

std::optional<model::CatalogEntryRecord> MemoryRepository::GetCatalogEntry(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.catalog.find(id);
  if (it == s.catalog.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CatalogEntryRecord> MemoryRepository::ListCatalogEntries(Transaction& t, bool approved_only) {
  std::vector<model::CatalogEntryRecord> out;
  for (const auto& [_, entry] : TX(t).View().catalog) {
    if (approved_only && !entry.approved) continue;
    out.push_back(entry);
  }
  return out;
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result MemoryRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  TX(t).Mutable().settings[key] = value;
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetSetting(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.settings.find(key);
  if (it == s.settings.end()) return std::nullopt;
  return it->second;
}

} // namespace mirrorsync::db::memory
