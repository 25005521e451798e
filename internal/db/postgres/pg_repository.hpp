#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace mirrorsync::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMirror(Transaction&, const model::MirrorRecord&) override;
  std::optional<model::MirrorRecord> GetMirror(Transaction&, const std::string&) override;
  std::optional<model::MirrorRecord> FindMirrorByCredential(Transaction&, const std::string&) override;
  std::vector<model::MirrorRecord> ListMirrors(Transaction&) override;
  Result UpdateMirror(Transaction&, const model::MirrorRecord&) override;

  Result InsertPairingCode(Transaction&, const model::PairingCodeRecord&) override;
  std::optional<model::PairingCodeRecord> GetPairingCode(Transaction&, const std::string&) override;
  Result UpdatePairingCode(Transaction&, const model::PairingCodeRecord&) override;
  uint64_t CountOutstandingPairingCodes(Transaction&, uint64_t now_ms) override;
  uint64_t DeleteExpiredPairingCodes(Transaction&, uint64_t now_ms) override;

  Result UpsertMirrorFile(Transaction&, const model::MirrorFileRecord&) override;
  std::optional<model::MirrorFileRecord> GetMirrorFile(Transaction&, const std::string& mirror_id,
                                                       const std::string& entry_id) override;
  std::vector<model::MirrorFileRecord> ListMirrorFiles(Transaction&, const std::string& mirror_id) override;
  std::vector<model::MirrorFileRecord> ListHoldersOf(Transaction&, const std::string& entry_id) override;
  Result DeleteMirrorFile(Transaction&, const std::string& mirror_id, const std::string& entry_id) override;

  Result AppendSyncLog(Transaction&, model::SyncLogRecord&) override;
  std::vector<model::SyncLogRecord> ListSyncLog(Transaction&, const std::string& mirror_id, uint64_t limit) override;

  Result UpsertCatalogEntry(Transaction&, const model::CatalogEntryRecord&) override;
  std::optional<model::CatalogEntryRecord> GetCatalogEntry(Transaction&, const std::string&) override;
  std::vector<model::CatalogEntryRecord> ListCatalogEntries(Transaction&, bool approved_only) override;

  Result PutSetting(Transaction&, const std::string& key, const std::string& value) override;
  std::optional<std::string> GetSetting(Transaction&, const std::string& key) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

} // namespace mirrorsync::db::postgres
