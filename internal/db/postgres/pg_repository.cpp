#include "pg_repository.hpp"

namespace mirrorsync::db::postgres {

namespace {

constexpr const char* kFileColumns =
    "mirror_id,entry_id,state,synced_at_ms,size_bytes,content_hash,popularity,created_at_ms,download_count";

constexpr const char* kCatalogColumns = "id,content_hash,size_bytes,download_count,created_at_ms,approved,filename";

model::MirrorRecord ReadMirror(const pqxx::row& row) {
  model::MirrorRecord r;
  r.id                = row[0].c_str();
  r.name              = row[1].c_str();
  r.status            = static_cast<mirrorsync::v1::MirrorStatus>(row[2].as<int>());
  r.credential        = row[3].c_str();
  r.direct_url        = row[4].c_str();
  r.tunnel_url        = row[5].c_str();
  r.max_files         = row[6].as<uint64_t>();
  r.last_heartbeat_ms = row[7].as<uint64_t>();
  r.created_at_ms     = row[8].as<uint64_t>();
  r.last_sync_ms      = row[9].as<uint64_t>();
  r.reported_files    = row[10].as<uint64_t>();
  return r;
}

model::MirrorFileRecord ReadMirrorFile(const pqxx::row& row) {
  model::MirrorFileRecord r;
  r.mirror_id      = row[0].c_str();
  r.entry_id       = row[1].c_str();
  r.state          = static_cast<mirrorsync::v1::VerificationState>(row[2].as<int>());
  r.synced_at_ms   = row[3].as<uint64_t>();
  r.size_bytes     = row[4].as<uint64_t>();
  r.content_hash   = row[5].c_str();
  r.popularity     = row[6].as<uint64_t>();
  r.created_at_ms  = row[7].as<uint64_t>();
  r.download_count = row[8].as<uint64_t>();
  return r;
}

model::CatalogEntryRecord ReadCatalogEntry(const pqxx::row& row) {
  model::CatalogEntryRecord r;
  r.id             = row[0].c_str();
  r.content_hash   = row[1].c_str();
  r.size_bytes     = row[2].as<uint64_t>();
  r.download_count = row[3].as<uint64_t>();
  r.created_at_ms  = row[4].as<uint64_t>();
  r.approved       = row[5].as<bool>();
  r.filename       = row[6].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Mirrors
// ------------------------------------------------------------------

Result PgRepository::InsertMirror(Transaction& t, const model::MirrorRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_mirror", r.id, r.name, static_cast<int>(r.status), r.credential, r.direct_url, r.tunnel_url,
                               static_cast<int64_t>(r.max_files), static_cast<int64_t>(r.last_heartbeat_ms),
                               static_cast<int64_t>(r.created_at_ms), static_cast<int64_t>(r.last_sync_ms),
                               static_cast<int64_t>(r.reported_files));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MirrorRecord> PgRepository::GetMirror(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_mirror", id);
  if (res.empty()) return std::nullopt;
  return ReadMirror(res[0]);
}

std::optional<model::MirrorRecord> PgRepository::FindMirrorByCredential(Transaction& t, const std::string& credential) {
  if (credential.empty()) return std::nullopt;
  auto res = TX(t).Work().exec_prepared("find_mirror_by_credential", credential);
  if (res.empty()) return std::nullopt;
  return ReadMirror(res[0]);
}

std::vector<model::MirrorRecord> PgRepository::ListMirrors(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT id,name,status,credential,direct_url,tunnel_url,max_files,last_heartbeat_ms,created_at_ms,last_sync_ms,reported_files "
      "FROM mirrors ORDER BY created_at_ms, id;");

  std::vector<model::MirrorRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadMirror(row));
  }
  return records;
}

Result PgRepository::UpdateMirror(Transaction& t, const model::MirrorRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_mirror", r.id, r.name, static_cast<int>(r.status), r.direct_url, r.tunnel_url,
                                          static_cast<int64_t>(r.max_files), static_cast<int64_t>(r.last_heartbeat_ms),
                                          static_cast<int64_t>(r.last_sync_ms), static_cast<int64_t>(r.reported_files));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "mirror " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Pairing codes
// ------------------------------------------------------------------

Result PgRepository::InsertPairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO pairing_codes(code,issued_at_ms,expires_at_ms,consumed,mirror_id) VALUES($1,$2,$3,$4,$5);",
                             r.code, static_cast<int64_t>(r.issued_at_ms), static_cast<int64_t>(r.expires_at_ms), r.consumed,
                             r.mirror_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PairingCodeRecord> PgRepository::GetPairingCode(Transaction& t, const std::string& code) {
  auto res = TX(t).Work().exec_prepared("get_pairing_code_for_update", code);
  if (res.empty()) return std::nullopt;

  model::PairingCodeRecord r;
  r.code          = res[0][0].c_str();
  r.issued_at_ms  = res[0][1].as<uint64_t>();
  r.expires_at_ms = res[0][2].as<uint64_t>();
  r.consumed      = res[0][3].as<bool>();
  r.mirror_id     = res[0][4].c_str();
  return r;
}

Result PgRepository::UpdatePairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE pairing_codes SET issued_at_ms=$2,expires_at_ms=$3,consumed=$4,mirror_id=$5 WHERE code=$1;",
                                        r.code, static_cast<int64_t>(r.issued_at_ms), static_cast<int64_t>(r.expires_at_ms), r.consumed,
                                        r.mirror_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "pairing code");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountOutstandingPairingCodes(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM pairing_codes WHERE NOT consumed AND expires_at_ms>$1;",
                                      static_cast<int64_t>(now_ms));
  return res[0][0].as<uint64_t>();
}

uint64_t PgRepository::DeleteExpiredPairingCodes(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params("DELETE FROM pairing_codes WHERE NOT consumed AND expires_at_ms<=$1;", static_cast<int64_t>(now_ms));
  return static_cast<uint64_t>(res.affected_rows());
}

// ------------------------------------------------------------------
// Mirror files
// ------------------------------------------------------------------

Result PgRepository::UpsertMirrorFile(Transaction& t, const model::MirrorFileRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_mirror_file", r.mirror_id, r.entry_id, static_cast<int>(r.state),
                               static_cast<int64_t>(r.synced_at_ms), static_cast<int64_t>(r.size_bytes), r.content_hash,
                               static_cast<int64_t>(r.popularity), static_cast<int64_t>(r.created_at_ms),
                               static_cast<int64_t>(r.download_count));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MirrorFileRecord> PgRepository::GetMirrorFile(Transaction& t, const std::string& mirror_id,
                                                                   const std::string& entry_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kFileColumns + " FROM mirror_files WHERE mirror_id=$1 AND entry_id=$2;",
                                      mirror_id, entry_id);
  if (res.empty()) return std::nullopt;
  return ReadMirrorFile(res[0]);
}

std::vector<model::MirrorFileRecord> PgRepository::ListMirrorFiles(Transaction& t, const std::string& mirror_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kFileColumns + " FROM mirror_files WHERE mirror_id=$1 ORDER BY entry_id;",
                                      mirror_id);

  std::vector<model::MirrorFileRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadMirrorFile(row));
  }
  return out;
}

std::vector<model::MirrorFileRecord> PgRepository::ListHoldersOf(Transaction& t, const std::string& entry_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kFileColumns + " FROM mirror_files WHERE entry_id=$1 ORDER BY mirror_id;",
                                      entry_id);

  std::vector<model::MirrorFileRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadMirrorFile(row));
  }
  return out;
}

Result PgRepository::DeleteMirrorFile(Transaction& t, const std::string& mirror_id, const std::string& entry_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM mirror_files WHERE mirror_id=$1 AND entry_id=$2;", mirror_id, entry_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Sync log
// ------------------------------------------------------------------

Result PgRepository::AppendSyncLog(Transaction& t, model::SyncLogRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("append_sync_log", r.mirror_id, r.entry_id, static_cast<int>(r.action),
                                          static_cast<int64_t>(r.at_ms), r.detail);
    r.seq = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SyncLogRecord> PgRepository::ListSyncLog(Transaction& t, const std::string& mirror_id, uint64_t limit) {
  // LIMIT NULL is "no limit" in postgres
  std::optional<int64_t> bound;
  if (limit != 0) bound = static_cast<int64_t>(limit);

  auto res = TX(t).Work().exec_params(
      "SELECT seq,mirror_id,entry_id,action,at_ms,detail FROM sync_log "
      "WHERE ($1 = '' OR mirror_id=$1) ORDER BY seq DESC LIMIT $2;",
      mirror_id, bound);

  std::vector<model::SyncLogRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::SyncLogRecord r;
    r.seq       = row[0].as<uint64_t>();
    r.mirror_id = row[1].c_str();
    r.entry_id  = row[2].c_str();
    r.action    = static_cast<mirrorsync::v1::SyncAction>(row[3].as<int>());
    r.at_ms     = row[4].as<uint64_t>();
    r.detail    = row[5].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result PgRepository::UpsertCatalogEntry(Transaction& t, const model::CatalogEntryRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO catalog_entries(id,content_hash,size_bytes,download_count,created_at_ms,approved,filename) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) "
        "ON CONFLICT(id) DO UPDATE SET content_hash=EXCLUDED.content_hash,size_bytes=EXCLUDED.size_bytes,"
        "download_count=EXCLUDED.download_count,created_at_ms=EXCLUDED.created_at_ms,approved=EXCLUDED.approved,filename=EXCLUDED.filename;",
        r.id, r.content_hash, static_cast<int64_t>(r.size_bytes), static_cast<int64_t>(r.download_count),
        static_cast<int64_t>(r.created_at_ms), r.approved, r.filename);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CatalogEntryRecord> PgRepository::GetCatalogEntry(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kCatalogColumns + " FROM catalog_entries WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadCatalogEntry(res[0]);
}

std::vector<model::CatalogEntryRecord> PgRepository::ListCatalogEntries(Transaction& t, bool approved_only) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kCatalogColumns + " FROM catalog_entries WHERE (NOT $1 OR approved) ORDER BY id;", approved_only);

  std::vector<model::CatalogEntryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadCatalogEntry(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result PgRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  try {
    TX(t).Work().exec_params("INSERT INTO node_settings(key,value) VALUES($1,$2) ON CONFLICT(key) DO UPDATE SET value=EXCLUDED.value;",
                             key, value);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::GetSetting(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_params("SELECT value FROM node_settings WHERE key=$1;", key);
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

} // namespace mirrorsync::db::postgres
