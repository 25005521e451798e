#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/catalog_entry_record.hpp"
#include "internal/db/model/mirror_file_record.hpp"
#include "internal/db/model/mirror_record.hpp"
#include "internal/db/model/pairing_code_record.hpp"
#include "internal/db/model/sync_log_record.hpp"

namespace mirrorsync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A pairing redemption (code consumed + mirror created) commits or
    rolls back as one unit

  The DB is the source of truth for:
    the mirror registry
    pairing codes
    which mirror holds which entry
    the sync log

  The origin and every mirror agent each own one; an agent only touches
  its own mirror_files rows, the sync log and node settings.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Mirror registry
  // ---------------------------------------------------------------------

  virtual Result InsertMirror(Transaction&, const model::MirrorRecord&) = 0;

  virtual std::optional<model::MirrorRecord> GetMirror(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::MirrorRecord> FindMirrorByCredential(Transaction&, const std::string& credential) = 0;

  // Ordered by created_at, then id.
  virtual std::vector<model::MirrorRecord> ListMirrors(Transaction&) = 0;

  // Credential is never rewritten; NotFound if the row is missing.
  virtual Result UpdateMirror(Transaction&, const model::MirrorRecord&) = 0;

  // ---------------------------------------------------------------------
  // Pairing codes
  // ---------------------------------------------------------------------

  virtual Result InsertPairingCode(Transaction&, const model::PairingCodeRecord&) = 0;

  virtual std::optional<model::PairingCodeRecord> GetPairingCode(Transaction&, const std::string& code) = 0;

  virtual Result UpdatePairingCode(Transaction&, const model::PairingCodeRecord&) = 0;

  // Unconsumed codes with expires_at_ms > now_ms.
  virtual uint64_t CountOutstandingPairingCodes(Transaction&, uint64_t now_ms) = 0;

  // Removes unconsumed codes with expires_at_ms <= now_ms; returns how many
  // went. Consumed codes stay so a replay keeps failing as AlreadyConsumed.
  virtual uint64_t DeleteExpiredPairingCodes(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Mirror files
  // ---------------------------------------------------------------------

  virtual Result UpsertMirrorFile(Transaction&, const model::MirrorFileRecord&) = 0;

  virtual std::optional<model::MirrorFileRecord> GetMirrorFile(Transaction&, const std::string& mirror_id, const std::string& entry_id) = 0;

  // Ordered by entry id.
  virtual std::vector<model::MirrorFileRecord> ListMirrorFiles(Transaction&, const std::string& mirror_id) = 0;

  // Every mirror's row for one entry, ordered by mirror id.
  virtual std::vector<model::MirrorFileRecord> ListHoldersOf(Transaction&, const std::string& entry_id) = 0;

  virtual Result DeleteMirrorFile(Transaction&, const std::string& mirror_id, const std::string& entry_id) = 0;

  // ---------------------------------------------------------------------
  // Sync log (append only)
  // ---------------------------------------------------------------------

  // Assigns record.seq.
  virtual Result AppendSyncLog(Transaction&, model::SyncLogRecord& record) = 0;

  // Newest first. Empty mirror_id lists every mirror; limit 0 means no limit.
  virtual std::vector<model::SyncLogRecord> ListSyncLog(Transaction&, const std::string& mirror_id, uint64_t limit) = 0;

  // ---------------------------------------------------------------------
  // Catalog (read interface for the sync core)
  // ---------------------------------------------------------------------

  virtual Result UpsertCatalogEntry(Transaction&, const model::CatalogEntryRecord&) = 0;

  virtual std::optional<model::CatalogEntryRecord> GetCatalogEntry(Transaction&, const std::string& id) = 0;

  // Ordered by id.
  virtual std::vector<model::CatalogEntryRecord> ListCatalogEntries(Transaction&, bool approved_only) = 0;

  // ---------------------------------------------------------------------
  // Node settings (agent identity)
  // ---------------------------------------------------------------------

  virtual Result PutSetting(Transaction&, const std::string& key, const std::string& value) = 0;

  virtual std::optional<std::string> GetSetting(Transaction&, const std::string& key) = 0;
};

} // namespace mirrorsync::db
