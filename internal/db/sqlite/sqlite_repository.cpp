#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace mirrorsync::db::sqlite {

using mirrorsync::db::ErrorCode;
using mirrorsync::db::Result;

namespace {

// Owns one prepared statement for the duration of a repository call.
class Stmt {
 public:
  Stmt(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Stmt() {
    if (st_) sqlite3_finalize(st_);
  }

  Stmt(const Stmt&)            = delete;
  Stmt& operator=(const Stmt&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kMirrorColumns =
    "id,name,status,credential,direct_url,tunnel_url,max_files,last_heartbeat_ms,created_at_ms,last_sync_ms,reported_files";

model::MirrorRecord ReadMirror(sqlite3_stmt* st) {
  model::MirrorRecord r;
  r.id                = ColText(st, 0);
  r.name              = ColText(st, 1);
  r.status            = static_cast<mirrorsync::v1::MirrorStatus>(ColI32(st, 2));
  r.credential        = ColText(st, 3);
  r.direct_url        = ColText(st, 4);
  r.tunnel_url        = ColText(st, 5);
  r.max_files         = ColU64(st, 6);
  r.last_heartbeat_ms = ColU64(st, 7);
  r.created_at_ms     = ColU64(st, 8);
  r.last_sync_ms      = ColU64(st, 9);
  r.reported_files    = ColU64(st, 10);
  return r;
}

constexpr const char* kFileColumns =
    "mirror_id,entry_id,state,synced_at_ms,size_bytes,content_hash,popularity,created_at_ms,download_count";

model::MirrorFileRecord ReadMirrorFile(sqlite3_stmt* st) {
  model::MirrorFileRecord r;
  r.mirror_id      = ColText(st, 0);
  r.entry_id       = ColText(st, 1);
  r.state          = static_cast<mirrorsync::v1::VerificationState>(ColI32(st, 2));
  r.synced_at_ms   = ColU64(st, 3);
  r.size_bytes     = ColU64(st, 4);
  r.content_hash   = ColText(st, 5);
  r.popularity     = ColU64(st, 6);
  r.created_at_ms  = ColU64(st, 7);
  r.download_count = ColU64(st, 8);
  return r;
}

model::SyncLogRecord ReadSyncLog(sqlite3_stmt* st) {
  model::SyncLogRecord r;
  r.seq       = ColU64(st, 0);
  r.mirror_id = ColText(st, 1);
  r.entry_id  = ColText(st, 2);
  r.action    = static_cast<mirrorsync::v1::SyncAction>(ColI32(st, 3));
  r.at_ms     = ColU64(st, 4);
  r.detail    = ColText(st, 5);
  return r;
}

model::CatalogEntryRecord ReadCatalogEntry(sqlite3_stmt* st) {
  model::CatalogEntryRecord r;
  r.id             = ColText(st, 0);
  r.content_hash   = ColText(st, 1);
  r.size_bytes     = ColU64(st, 2);
  r.download_count = ColU64(st, 3);
  r.created_at_ms  = ColU64(st, 4);
  r.approved       = ColI32(st, 5) != 0;
  r.filename       = ColText(st, 6);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Mirrors
// ------------------------------------------------------------------

Result SqliteRepository::InsertMirror(Transaction& t, const model::MirrorRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db,
          "INSERT INTO mirrors(id,name,status,credential,direct_url,tunnel_url,max_files,last_heartbeat_ms,created_at_ms,last_sync_ms,reported_files)"
          " VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindI32(st.get(), 3, static_cast<int>(r.status));
  BindText(st.get(), 4, r.credential);
  BindText(st.get(), 5, r.direct_url);
  BindText(st.get(), 6, r.tunnel_url);
  BindU64(st.get(), 7, r.max_files);
  BindU64(st.get(), 8, r.last_heartbeat_ms);
  BindU64(st.get(), 9, r.created_at_ms);
  BindU64(st.get(), 10, r.last_sync_ms);
  BindU64(st.get(), 11, r.reported_files);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  }
  return Translate(db, rc);
}

std::optional<model::MirrorRecord> SqliteRepository::GetMirror(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kMirrorColumns + " FROM mirrors WHERE id=?;";
  Stmt              st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadMirror(st.get());
}

std::optional<model::MirrorRecord> SqliteRepository::FindMirrorByCredential(Transaction& t, const std::string& credential) {
  if (credential.empty()) return std::nullopt;
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kMirrorColumns + " FROM mirrors WHERE credential=?;";
  Stmt              st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, credential);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadMirror(st.get());
}

std::vector<model::MirrorRecord> SqliteRepository::ListMirrors(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::MirrorRecord> out;
  const std::string                sql = std::string("SELECT ") + kMirrorColumns + " FROM mirrors ORDER BY created_at_ms, id;";
  Stmt                             st(db, sql.c_str());
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadMirror(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateMirror(Transaction& t, const model::MirrorRecord& r) {
  auto* db = TX(t).Handle();

  // credential is never rewritten
  Stmt st(db,
          "UPDATE mirrors SET name=?,status=?,direct_url=?,tunnel_url=?,max_files=?,last_heartbeat_ms=?,last_sync_ms=?,reported_files=?"
          " WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.name);
  BindI32(st.get(), 2, static_cast<int>(r.status));
  BindText(st.get(), 3, r.direct_url);
  BindText(st.get(), 4, r.tunnel_url);
  BindU64(st.get(), 5, r.max_files);
  BindU64(st.get(), 6, r.last_heartbeat_ms);
  BindU64(st.get(), 7, r.last_sync_ms);
  BindU64(st.get(), 8, r.reported_files);
  BindText(st.get(), 9, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "mirror " + r.id);
  }
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Pairing codes
// ------------------------------------------------------------------

Result SqliteRepository::InsertPairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, "INSERT INTO pairing_codes(code,issued_at_ms,expires_at_ms,consumed,mirror_id) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.code);
  BindU64(st.get(), 2, r.issued_at_ms);
  BindU64(st.get(), 3, r.expires_at_ms);
  BindI32(st.get(), 4, r.consumed ? 1 : 0);
  BindText(st.get(), 5, r.mirror_id);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "pairing code");
  }
  return Translate(db, rc);
}

std::optional<model::PairingCodeRecord> SqliteRepository::GetPairingCode(Transaction& t, const std::string& code) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT code,issued_at_ms,expires_at_ms,consumed,mirror_id FROM pairing_codes WHERE code=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, code);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::PairingCodeRecord r;
  r.code          = ColText(st.get(), 0);
  r.issued_at_ms  = ColU64(st.get(), 1);
  r.expires_at_ms = ColU64(st.get(), 2);
  r.consumed      = ColI32(st.get(), 3) != 0;
  r.mirror_id     = ColText(st.get(), 4);
  return r;
}

Result SqliteRepository::UpdatePairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, "UPDATE pairing_codes SET issued_at_ms=?,expires_at_ms=?,consumed=?,mirror_id=? WHERE code=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.issued_at_ms);
  BindU64(st.get(), 2, r.expires_at_ms);
  BindI32(st.get(), 3, r.consumed ? 1 : 0);
  BindText(st.get(), 4, r.mirror_id);
  BindText(st.get(), 5, r.code);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "pairing code");
  }
  return Translate(db, rc);
}

uint64_t SqliteRepository::CountOutstandingPairingCodes(Transaction& t, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT COUNT(*) FROM pairing_codes WHERE consumed=0 AND expires_at_ms>?;");
  if (!st) return 0;

  BindU64(st.get(), 1, now_ms);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

uint64_t SqliteRepository::DeleteExpiredPairingCodes(Transaction& t, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Stmt st(db, "DELETE FROM pairing_codes WHERE consumed=0 AND expires_at_ms<=?;");
  if (!st) return 0;

  BindU64(st.get(), 1, now_ms);
  if (sqlite3_step(st.get()) != SQLITE_DONE) return 0;
  return static_cast<uint64_t>(sqlite3_changes(db));
}

// ------------------------------------------------------------------
// Mirror files
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMirrorFile(Transaction& t, const model::MirrorFileRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db,
          "INSERT INTO mirror_files(mirror_id,entry_id,state,synced_at_ms,size_bytes,content_hash,popularity,created_at_ms,download_count)"
          " VALUES(?,?,?,?,?,?,?,?,?)"
          " ON CONFLICT(mirror_id,entry_id) DO UPDATE SET"
          " state=excluded.state, synced_at_ms=excluded.synced_at_ms, size_bytes=excluded.size_bytes,"
          " content_hash=excluded.content_hash, popularity=excluded.popularity,"
          " created_at_ms=excluded.created_at_ms, download_count=excluded.download_count;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.mirror_id);
  BindText(st.get(), 2, r.entry_id);
  BindI32(st.get(), 3, static_cast<int>(r.state));
  BindU64(st.get(), 4, r.synced_at_ms);
  BindU64(st.get(), 5, r.size_bytes);
  BindText(st.get(), 6, r.content_hash);
  BindU64(st.get(), 7, r.popularity);
  BindU64(st.get(), 8, r.created_at_ms);
  BindU64(st.get(), 9, r.download_count);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MirrorFileRecord> SqliteRepository::GetMirrorFile(Transaction& t, const std::string& mirror_id,
                                                                       const std::string& entry_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kFileColumns + " FROM mirror_files WHERE mirror_id=? AND entry_id=?;";
  Stmt              st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, mirror_id);
  BindText(st.get(), 2, entry_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadMirrorFile(st.get());
}

std::vector<model::MirrorFileRecord> SqliteRepository::ListMirrorFiles(Transaction& t, const std::string& mirror_id) {
  auto* db = TX(t).Handle();

  std::vector<model::MirrorFileRecord> out;
  const std::string sql = std::string("SELECT ") + kFileColumns + " FROM mirror_files WHERE mirror_id=? ORDER BY entry_id;";
  Stmt              st(db, sql.c_str());
  if (!st) return out;

  BindText(st.get(), 1, mirror_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadMirrorFile(st.get()));
  }
  return out;
}

std::vector<model::MirrorFileRecord> SqliteRepository::ListHoldersOf(Transaction& t, const std::string& entry_id) {
  auto* db = TX(t).Handle();

  std::vector<model::MirrorFileRecord> out;
  const std::string sql = std::string("SELECT ") + kFileColumns + " FROM mirror_files WHERE entry_id=? ORDER BY mirror_id;";
  Stmt              st(db, sql.c_str());
  if (!st) return out;

  BindText(st.get(), 1, entry_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadMirrorFile(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteMirrorFile(Transaction& t, const std::string& mirror_id, const std::string& entry_id) {
  auto* db = TX(t).Handle();

  Stmt st(db, "DELETE FROM mirror_files WHERE mirror_id=? AND entry_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, mirror_id);
  BindText(st.get(), 2, entry_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Sync log
// ------------------------------------------------------------------

Result SqliteRepository::AppendSyncLog(Transaction& t, model::SyncLogRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, "INSERT INTO sync_log(mirror_id,entry_id,action,at_ms,detail) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.mirror_id);
  BindText(st.get(), 2, r.entry_id);
  BindI32(st.get(), 3, static_cast<int>(r.action));
  BindU64(st.get(), 4, r.at_ms);
  BindText(st.get(), 5, r.detail);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::SyncLogRecord> SqliteRepository::ListSyncLog(Transaction& t, const std::string& mirror_id, uint64_t limit) {
  auto* db = TX(t).Handle();

  std::vector<model::SyncLogRecord> out;

  // LIMIT -1 is "no limit" in sqlite
  const char* sql = mirror_id.empty()
                        ? "SELECT seq,mirror_id,entry_id,action,at_ms,detail FROM sync_log ORDER BY seq DESC LIMIT ?;"
                        : "SELECT seq,mirror_id,entry_id,action,at_ms,detail FROM sync_log WHERE mirror_id=? ORDER BY seq DESC LIMIT ?;";
  Stmt st(db, sql);
  if (!st) return out;

  int idx = 1;
  if (!mirror_id.empty()) BindText(st.get(), idx++, mirror_id);
  sqlite3_bind_int64(st.get(), idx, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadSyncLog(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCatalogEntry(Transaction& t, const model::CatalogEntryRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db,
          "INSERT INTO catalog_entries(id,content_hash,size_bytes,download_count,created_at_ms,approved,filename)"
          " VALUES(?,?,?,?,?,?,?)"
          " ON CONFLICT(id) DO UPDATE SET"
          " content_hash=excluded.content_hash, size_bytes=excluded.size_bytes, download_count=excluded.download_count,"
          " created_at_ms=excluded.created_at_ms, approved=excluded.approved, filename=excluded.filename;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.content_hash);
  BindU64(st.get(), 3, r.size_bytes);
  BindU64(st.get(), 4, r.download_count);
  BindU64(st.get(), 5, r.created_at_ms);
  BindI32(st.get(), 6, r.approved ? 1 : 0);
  BindText(st.get(), 7, r.filename);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CatalogEntryRecord> SqliteRepository::GetCatalogEntry(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT id,content_hash,size_bytes,download_count,created_at_ms,approved,filename FROM catalog_entries WHERE id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadCatalogEntry(st.get());
}

std::vector<model::CatalogEntryRecord> SqliteRepository::ListCatalogEntries(Transaction& t, bool approved_only) {
  auto* db = TX(t).Handle();

  std::vector<model::CatalogEntryRecord> out;
  const char* sql = approved_only
                        ? "SELECT id,content_hash,size_bytes,download_count,created_at_ms,approved,filename FROM catalog_entries WHERE approved=1 ORDER BY id;"
                        : "SELECT id,content_hash,size_bytes,download_count,created_at_ms,approved,filename FROM catalog_entries ORDER BY id;";
  Stmt st(db, sql);
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadCatalogEntry(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result SqliteRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  auto* db = TX(t).Handle();

  Stmt st(db, "INSERT INTO node_settings(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, key);
  BindText(st.get(), 2, value);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<std::string> SqliteRepository::GetSetting(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT value FROM node_settings WHERE key=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, key);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ColText(st.get(), 0);
}

} // namespace mirrorsync::db::sqlite
