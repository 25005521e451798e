#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/catalog_entry_record.hpp"
#include "internal/db/model/mirror_file_record.hpp"
#include "internal/util/time.hpp"
#include "mirrorsync/v1/mirror_service.pb.h"

namespace mirrorsync::db {
class Repository;
class Transaction;
} // namespace mirrorsync::db

namespace mirrorsync::storage {
class ContentStore;
}

namespace mirrorsync::agent {

class OriginLink;

struct AgentOptions {
  std::string mirror_name;
  uint64_t    max_files = 0;
  std::string direct_url;
  std::string tunnel_url;

  std::string content_hash_algorithm = "md5";
  // bytes/second per download; 0 = unlimited
  uint64_t download_speed_limit = 0;
};

/*
  The mirror node.

  Holds at most max_files verified replicas, keyed by catalog entry id in
  the content store and indexed by mirror_files rows in the local
  repository. The index and the files change together under storage_mutex_;
  a row exists only for a file that was fully written and hash-checked.

  Identity (mirror id + credential) lives in node settings so a restart
  keeps the pairing.
*/
class MirrorAgent {
 public:
  // Returns false once the receiver is gone.
  using ChunkSink = std::function<bool(const void* data, size_t size, uint64_t offset, uint64_t total)>;

  MirrorAgent(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::ContentStore> store, std::shared_ptr<OriginLink> origin,
              AgentOptions options, util::MillisClock clock = util::NowMillis);

  MirrorAgent(const MirrorAgent&)            = delete;
  MirrorAgent& operator=(const MirrorAgent&) = delete;

  mirrorsync::v1::HealthResponse Health() const;

  // Throws InvalidState when already paired; pairing errors from the
  // origin propagate unchanged.
  mirrorsync::v1::PairResponse Pair(const std::string& code, const std::string& direct_url, const std::string& tunnel_url);

  // Throws Unauthenticated unless credential is this node's.
  mirrorsync::v1::ApplySyncResponse ApplySync(const std::string& credential, const mirrorsync::v1::ApplySyncRequest& request);

  // Streams a verified replica; throws NotFound otherwise. Returns true when
  // every byte went out, false when the client cancelled.
  bool ServeDownload(const std::string& entry_id, const ChunkSink& sink, const std::function<bool()>& cancelled);

  mirrorsync::v1::ListFilesResponse ListFiles(const std::string& credential) const;

  // Local sync log, newest first.
  mirrorsync::v1::ListLogResponse ListLog(const std::string& credential, uint32_t limit) const;

  // Index repair plus a sync request to the origin. Returns rows dropped.
  size_t Maintain();

  mirrorsync::v1::MirrorCounters Counters() const;

  bool        Paired() const;
  std::string MirrorId() const;
  std::string Credential() const;

  const AgentOptions& Options() const {
    return options_;
  }

 private:
  class ActiveDownload;

  void LoadIdentity();
  void RequireCredential(const std::string& credential) const;

  std::vector<db::model::MirrorFileRecord> VerifiedHoldings(db::Transaction& tx) const;

  // Holdings that storing `entry` would displace; nullopt when `entry` ranks
  // below every current holding of a full node.
  std::optional<std::vector<db::model::CatalogEntryRecord>> Displaced(db::Transaction& tx, const mirrorsync::v1::CatalogEntry& entry) const;

  // Each helper appends to `outcomes` and the local sync log.
  void Evict(db::Transaction& tx, const std::string& entry_id, const std::string& detail, mirrorsync::v1::ApplySyncResponse& out);
  void Fetch(const std::string& credential, const mirrorsync::v1::CatalogEntry& entry, mirrorsync::v1::ApplySyncResponse& out);
  void Record(db::Transaction& tx, const std::string& entry_id, mirrorsync::v1::SyncAction action, const std::string& detail,
              mirrorsync::v1::ApplySyncResponse* out);
  size_t EnforceCapacity(db::Transaction& tx, mirrorsync::v1::ApplySyncResponse* out);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<storage::ContentStore> store_;
  std::shared_ptr<OriginLink>            origin_;
  AgentOptions                           options_;
  util::MillisClock                      clock_;

  // Serializes Pair() without blocking identity reads during the origin call.
  std::mutex pair_mutex_;

  mutable std::mutex identity_mutex_;
  std::string        mirror_id_;
  std::string        credential_;

  // Guards the content store and the mirror_files index together.
  mutable std::mutex storage_mutex_;

  std::atomic<uint64_t> active_downloads_{0};
  std::atomic<uint64_t> downloads_served_{0};
};

} // namespace mirrorsync::agent
