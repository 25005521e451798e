#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace mirrorsync::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::MirrorRecord> mirrors;
    std::unordered_map<std::string, model::PairingCodeRecord> pairing_codes;

    // (mirror_id, entry_id); ordered so listings come out sorted
    std::map<std::pair<std::string, std::string>, model::MirrorFileRecord> mirror_files;

    std::vector<model::SyncLogRecord> sync_log;
    uint64_t next_log_seq = 1;

    std::map<std::string, model::CatalogEntryRecord> catalog;
    std::unordered_map<std::string, std::string> settings;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

} // namespace mirrorsync::db::memory
