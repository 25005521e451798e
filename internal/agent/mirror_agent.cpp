#include "internal/agent/mirror_agent.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_set>

#include "internal/agent/download_throttle.hpp"
#include "internal/agent/origin_link.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/mirror_status.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/policy/priority_policy.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/content_store.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/secrets.hpp"

namespace mirrorsync::agent {

using mirrorsync::observability::StringField;
using mirrorsync::observability::BoolField;
using mirrorsync::observability::UintField;
using namespace mirrorsync::v1;

namespace {

constexpr const char* kMirrorIdKey   = "mirror_id";
constexpr const char* kCredentialKey = "credential";
constexpr uint32_t    kDefaultLogLimit = 100;
constexpr const char* kNoRoom        = "capacity exceeded: ranks below every current holding";

void VerifyContent(const CatalogEntry& entry, uint64_t size, const std::string& digest) {
  if (size != entry.size_bytes()) {
    throw util::HashMismatch("size mismatch: expected " + std::to_string(entry.size_bytes()) + " bytes, got " + std::to_string(size));
  }
  if (!util::HexEqualIgnoreCase(digest, entry.content_hash())) {
    throw util::HashMismatch("hash mismatch: expected " + entry.content_hash() + ", got " + digest);
  }
}

} // namespace

class MirrorAgent::ActiveDownload {
 public:
  explicit ActiveDownload(std::atomic<uint64_t>& counter) : counter_(counter) {
    ++counter_;
  }
  ~ActiveDownload() {
    --counter_;
  }

  ActiveDownload(const ActiveDownload&)            = delete;
  ActiveDownload& operator=(const ActiveDownload&) = delete;

 private:
  std::atomic<uint64_t>& counter_;
};

MirrorAgent::MirrorAgent(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::ContentStore> store,
                         std::shared_ptr<OriginLink> origin, AgentOptions options, util::MillisClock clock)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      origin_(std::move(origin)),
      options_(std::move(options)),
      clock_(std::move(clock)) {
  LoadIdentity();
}

void MirrorAgent::LoadIdentity() {
  auto tx         = repository_->Begin();
  auto mirror_id  = repository_->GetSetting(*tx, kMirrorIdKey);
  auto credential = repository_->GetSetting(*tx, kCredentialKey);
  tx->Commit();

  if (mirror_id && credential) {
    std::lock_guard lock(identity_mutex_);
    mirror_id_  = *mirror_id;
    credential_ = *credential;
    MIRRORSYNC_LOG_INFO("mirror identity loaded", {StringField("mirror_id", mirror_id_)});
  }
}

bool MirrorAgent::Paired() const {
  std::lock_guard lock(identity_mutex_);
  return !mirror_id_.empty();
}

std::string MirrorAgent::MirrorId() const {
  std::lock_guard lock(identity_mutex_);
  return mirror_id_;
}

std::string MirrorAgent::Credential() const {
  std::lock_guard lock(identity_mutex_);
  return credential_;
}

void MirrorAgent::RequireCredential(const std::string& credential) const {
  std::lock_guard lock(identity_mutex_);
  if (credential_.empty()) {
    throw util::Unauthenticated("node is not paired; pair it with a code issued by the origin");
  }
  if (!util::SecretEquals(credential, credential_)) {
    throw util::Unauthenticated("credential does not match this mirror");
  }
}

HealthResponse MirrorAgent::Health() const {
  HealthResponse resp;
  resp.set_healthy(true);
  {
    std::lock_guard lock(identity_mutex_);
    resp.set_paired(!mirror_id_.empty());
    resp.set_mirror_id(mirror_id_);
  }
  resp.set_name(options_.mirror_name);
  *resp.mutable_counters() = Counters();
  return resp;
}

PairResponse MirrorAgent::Pair(const std::string& code, const std::string& direct_url, const std::string& tunnel_url) {
  std::lock_guard pairing(pair_mutex_);
  if (Paired()) {
    throw util::InvalidState("pair: node is already paired as " + MirrorId() + "; clear its database to pair again");
  }
  if (code.empty()) {
    throw util::InvalidArgument("pair: pairing code is required");
  }

  RedeemRequest req;
  req.set_pairing_code(code);
  req.set_mirror_name(options_.mirror_name);
  req.set_direct_url(direct_url.empty() ? options_.direct_url : direct_url);
  req.set_tunnel_url(tunnel_url.empty() ? options_.tunnel_url : tunnel_url);
  req.set_max_files(options_.max_files);

  const auto redeemed = origin_->Redeem(req);

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->PutSetting(*tx, kMirrorIdKey, redeemed.mirror_id()), "pair: store mirror id");
  db::ThrowIfDbError(repository_->PutSetting(*tx, kCredentialKey, redeemed.credential()), "pair: store credential");
  tx->Commit();

  {
    std::lock_guard lock(identity_mutex_);
    mirror_id_  = redeemed.mirror_id();
    credential_ = redeemed.credential();
  }

  MIRRORSYNC_LOG_INFO("paired with origin; awaiting approval", {StringField("mirror_id", redeemed.mirror_id())});

  PairResponse resp;
  resp.set_mirror_id(redeemed.mirror_id());
  resp.set_credential(redeemed.credential());
  return resp;
}

std::vector<db::model::MirrorFileRecord> MirrorAgent::VerifiedHoldings(db::Transaction& tx) const {
  auto rows = repository_->ListMirrorFiles(tx, MirrorId());
  rows.erase(std::remove_if(rows.begin(), rows.end(), [](const auto& r) { return r.state != VERIFICATION_STATE_VERIFIED; }), rows.end());
  return rows;
}

void MirrorAgent::Record(db::Transaction& tx, const std::string& entry_id, SyncAction action, const std::string& detail,
                         ApplySyncResponse* out) {
  db::model::SyncLogRecord entry;
  entry.mirror_id = MirrorId();
  entry.entry_id  = entry_id;
  entry.action    = action;
  entry.at_ms     = clock_();
  entry.detail    = detail;
  db::ThrowIfDbError(repository_->AppendSyncLog(tx, entry), "local sync log");

  if (out) {
    auto* outcome = out->add_outcomes();
    outcome->set_entry_id(entry_id);
    outcome->set_action(action);
    outcome->set_detail(detail);
  }

  if (action == SYNC_ACTION_VERIFY_FAIL || action == SYNC_ACTION_FETCH_FAIL) {
    MIRRORSYNC_LOG_WARN("replica not stored", {StringField("entry_id", entry_id), StringField("action", model::ActionName(action)),
                                               StringField("detail", detail)});
  }
}

void MirrorAgent::Evict(db::Transaction& tx, const std::string& entry_id, const std::string& detail, ApplySyncResponse& out) {
  store_->Remove(entry_id);
  if (repository_->GetMirrorFile(tx, MirrorId(), entry_id)) {
    db::ThrowIfDbError(repository_->DeleteMirrorFile(tx, MirrorId(), entry_id), "evict " + entry_id);
  }
  Record(tx, entry_id, SYNC_ACTION_EVICT, detail, &out);
}

size_t MirrorAgent::EnforceCapacity(db::Transaction& tx, ApplySyncResponse* out) {
  const auto holdings = VerifiedHoldings(tx);
  if (holdings.size() <= options_.max_files) return 0;

  std::vector<db::model::CatalogEntryRecord> ranked;
  ranked.reserve(holdings.size());
  for (const auto& h : holdings) ranked.push_back(model::AsCatalogEntry(h));

  const auto losers = policy::Lowest(std::move(ranked), holdings.size() - static_cast<size_t>(options_.max_files));
  for (const auto& loser : losers) {
    store_->Remove(loser.id);
    db::ThrowIfDbError(repository_->DeleteMirrorFile(tx, MirrorId(), loser.id), "evict " + loser.id);
    Record(tx, loser.id, SYNC_ACTION_EVICT, "over capacity", out);
  }
  return losers.size();
}

std::optional<std::vector<db::model::CatalogEntryRecord>> MirrorAgent::Displaced(db::Transaction& tx, const CatalogEntry& entry) const {
  const auto holdings = VerifiedHoldings(tx);
  if (holdings.size() < options_.max_files) return std::vector<db::model::CatalogEntryRecord>{};

  std::vector<db::model::CatalogEntryRecord> candidates;
  candidates.reserve(holdings.size() + 1);
  for (const auto& h : holdings) candidates.push_back(model::AsCatalogEntry(h));
  candidates.push_back(model::FromProto(entry));

  auto losers = policy::Lowest(std::move(candidates), holdings.size() + 1 - static_cast<size_t>(options_.max_files));
  if (std::any_of(losers.begin(), losers.end(), [&](const auto& l) { return l.id == entry.id(); })) return std::nullopt;
  return losers;
}

void MirrorAgent::Fetch(const std::string& credential, const CatalogEntry& entry, ApplySyncResponse& out) {
  const std::string& id = entry.id();

  // Checked again after the download; this one saves the transfer.
  {
    std::lock_guard lock(storage_mutex_);
    auto            tx = repository_->Begin();
    if (!Displaced(*tx, entry)) {
      Record(*tx, id, SYNC_ACTION_FETCH_FAIL, kNoRoom, &out);
      tx->Commit();
      return;
    }
    tx->Commit();
  }

  std::unique_ptr<storage::ContentWriter> writer;
  std::string                             digest;
  try {
    writer = store_->Stage(id);
    util::ContentHasher hasher(options_.content_hash_algorithm);
    origin_->FetchContent(credential, id, [&](std::string_view chunk) {
      hasher.Update(chunk.data(), chunk.size());
      writer->Append(chunk.data(), chunk.size());
    });
    digest = hasher.FinalHex();
    VerifyContent(entry, writer->BytesWritten(), digest);
  } catch (const util::HashMismatch& e) {
    writer.reset();
    std::lock_guard lock(storage_mutex_);
    auto            tx = repository_->Begin();
    Record(*tx, id, SYNC_ACTION_VERIFY_FAIL, e.what(), &out);
    tx->Commit();
    return;
  } catch (const std::exception& e) {
    writer.reset();
    std::lock_guard lock(storage_mutex_);
    auto            tx = repository_->Begin();
    Record(*tx, id, SYNC_ACTION_FETCH_FAIL, e.what(), &out);
    tx->Commit();
    return;
  }

  std::lock_guard lock(storage_mutex_);
  auto            tx = repository_->Begin();

  const auto displaced = Displaced(*tx, entry);
  if (!displaced) {
    writer.reset();
    Record(*tx, id, SYNC_ACTION_FETCH_FAIL, kNoRoom, &out);
    tx->Commit();
    return;
  }
  for (const auto& loser : *displaced) Evict(*tx, loser.id, "displaced by " + id, out);

  try {
    writer->Commit(true);
  } catch (const std::exception& e) {
    writer.reset();
    Record(*tx, id, SYNC_ACTION_FETCH_FAIL, std::string("store: ") + e.what(), &out);
    tx->Commit();
    return;
  }

  db::model::MirrorFileRecord row;
  row.mirror_id     = MirrorId();
  row.entry_id      = id;
  row.state         = VERIFICATION_STATE_VERIFIED;
  row.synced_at_ms  = clock_();
  row.size_bytes    = entry.size_bytes();
  row.content_hash  = digest;
  row.popularity    = entry.download_count();
  row.created_at_ms = model::FromProto(entry).created_at_ms;

  const auto upserted = repository_->UpsertMirrorFile(*tx, row);
  if (!upserted) {
    store_->Remove(id);
    db::ThrowIfDbError(upserted, "record replica " + id);
  }
  Record(*tx, id, SYNC_ACTION_PUSH, "", &out);
  tx->Commit();
}

ApplySyncResponse MirrorAgent::ApplySync(const std::string& credential, const ApplySyncRequest& request) {
  RequireCredential(credential);

  observability::SpanScope span("MirrorAgent.ApplySync");
  span.SetAttribute("sync.fetch", static_cast<int64_t>(request.fetch_size()));
  span.SetAttribute("sync.evict", static_cast<int64_t>(request.evict_size()));

  const std::string mirror_id = MirrorId();
  ApplySyncResponse out;

  // Evict first so fetched content has room.
  {
    std::lock_guard lock(storage_mutex_);
    auto            tx = repository_->Begin();

    for (const auto& entry : request.retain()) {
      auto row = repository_->GetMirrorFile(*tx, mirror_id, entry.id());
      if (!row) continue;
      row->popularity    = entry.download_count();
      row->created_at_ms = model::FromProto(entry).created_at_ms;
      db::ThrowIfDbError(repository_->UpsertMirrorFile(*tx, *row), "refresh " + entry.id());
    }

    for (const auto& id : request.evict()) {
      Evict(*tx, id, repository_->GetMirrorFile(*tx, mirror_id, id) ? "" : "not held", out);
    }
    tx->Commit();
  }

  for (const auto& entry : request.fetch()) {
    bool held = false;
    {
      std::lock_guard lock(storage_mutex_);
      auto            tx  = repository_->Begin();
      auto            row = repository_->GetMirrorFile(*tx, mirror_id, entry.id());
      held                = row && row->state == VERIFICATION_STATE_VERIFIED && store_->Exists(entry.id());
      tx->Commit();
    }
    if (held) continue;
    Fetch(credential, entry, out);
  }

  {
    std::lock_guard lock(storage_mutex_);
    auto            tx = repository_->Begin();
    EnforceCapacity(*tx, &out);
    for (const auto& row : VerifiedHoldings(*tx)) *out.add_holdings() = model::ToProto(model::AsCatalogEntry(row));
    tx->Commit();
  }

  MIRRORSYNC_LOG_INFO("sync instruction applied", {StringField("mirror_id", mirror_id), UintField("outcomes", out.outcomes_size()),
                                                   UintField("holdings", out.holdings_size())});
  return out;
}

bool MirrorAgent::ServeDownload(const std::string& entry_id, const ChunkSink& sink, const std::function<bool()>& cancelled) {
  std::shared_ptr<arrow::io::RandomAccessFile> file;
  {
    std::lock_guard lock(storage_mutex_);
    auto            tx  = repository_->Begin();
    auto            row = repository_->GetMirrorFile(*tx, MirrorId(), entry_id);
    tx->Commit();
    if (!row || row->state != VERIFICATION_STATE_VERIFIED) {
      throw util::NotFound("download: entry " + entry_id + " is not held by this mirror");
    }
    // An open handle survives a concurrent eviction.
    file = store_->Open(entry_id);
  }

  ActiveDownload slot(active_downloads_);

  const uint64_t   total = static_cast<uint64_t>(storage::common::Unwrap(file->GetSize()));
  DownloadThrottle throttle(options_.download_speed_limit);
  const size_t     chunk = throttle.ChunkSize();

  uint64_t offset = 0;
  while (offset < total) {
    const auto want   = static_cast<int64_t>(std::min<uint64_t>(chunk, total - offset));
    auto       buffer = storage::common::Unwrap(file->ReadAt(static_cast<int64_t>(offset), want));
    if (buffer->size() == 0) break;

    // A chunk leaves only once its last byte is within budget.
    const uint64_t end = offset + static_cast<uint64_t>(buffer->size());
    if (!throttle.Pace(end, cancelled)) {
      MIRRORSYNC_LOG_DEBUG("download cancelled", {StringField("entry_id", entry_id), UintField("sent", offset)});
      return false;
    }

    if (!sink(buffer->data(), static_cast<size_t>(buffer->size()), offset, total)) return false;
    offset = end;
  }

  ++downloads_served_;
  {
    std::lock_guard lock(storage_mutex_);
    auto            tx = repository_->Begin();
    if (auto row = repository_->GetMirrorFile(*tx, MirrorId(), entry_id)) {
      ++row->download_count;
      db::ThrowIfDbError(repository_->UpsertMirrorFile(*tx, *row), "download count " + entry_id);
    }
    tx->Commit();
  }
  return true;
}

ListFilesResponse MirrorAgent::ListFiles(const std::string& credential) const {
  RequireCredential(credential);

  ListFilesResponse resp;
  {
    std::lock_guard lock(storage_mutex_);
    auto            tx = repository_->Begin();
    for (const auto& row : VerifiedHoldings(*tx)) *resp.add_files() = model::ToProto(row);
    tx->Commit();
  }
  *resp.mutable_counters() = Counters();
  return resp;
}

ListLogResponse MirrorAgent::ListLog(const std::string& credential, uint32_t limit) const {
  RequireCredential(credential);

  ListLogResponse resp;
  auto            tx = repository_->Begin();
  for (const auto& entry : repository_->ListSyncLog(*tx, MirrorId(), limit == 0 ? kDefaultLogLimit : limit)) {
    *resp.add_entries() = model::ToProto(entry);
  }
  tx->Commit();
  return resp;
}

MirrorCounters MirrorAgent::Counters() const {
  MirrorCounters counters;
  counters.set_max_files(options_.max_files);
  counters.set_active_downloads(active_downloads_.load());
  counters.set_downloads_served(downloads_served_.load());

  if (!Paired()) return counters;

  std::lock_guard lock(storage_mutex_);
  auto            tx       = repository_->Begin();
  const auto      holdings = VerifiedHoldings(*tx);
  tx->Commit();

  uint64_t bytes = 0;
  for (const auto& h : holdings) bytes += h.size_bytes;
  counters.set_file_count(holdings.size());
  counters.set_total_bytes(bytes);
  return counters;
}

size_t MirrorAgent::Maintain() {
  if (!Paired()) return 0;

  size_t dropped = 0;
  {
    std::lock_guard lock(storage_mutex_);
    auto            tx = repository_->Begin();
    for (const auto& row : repository_->ListMirrorFiles(*tx, MirrorId())) {
      if (row.state == VERIFICATION_STATE_VERIFIED && store_->Exists(row.entry_id)) continue;
      store_->Remove(row.entry_id);
      db::ThrowIfDbError(repository_->DeleteMirrorFile(*tx, MirrorId(), row.entry_id), "maintain: drop " + row.entry_id);
      Record(*tx, row.entry_id, SYNC_ACTION_EVICT, "content file missing", nullptr);
      ++dropped;
    }
    dropped += EnforceCapacity(*tx, nullptr);
    tx->Commit();
  }

  if (dropped > 0) {
    MIRRORSYNC_LOG_WARN("local index repaired", {StringField("mirror_id", MirrorId()), UintField("dropped", dropped)});
  }

  try {
    const auto resp = origin_->TriggerSync(Credential(), MirrorId());
    MIRRORSYNC_LOG_DEBUG("sync requested", {BoolField("accepted", resp.accepted()), BoolField("already_pending", resp.already_pending())});
  } catch (const util::Unreachable& e) {
    MIRRORSYNC_LOG_WARN("origin unreachable; sync request skipped", {StringField("error", e.what())});
  } catch (const util::InvalidState& e) {
    MIRRORSYNC_LOG_DEBUG("sync request refused", {StringField("reason", e.what())});
  }
  return dropped;
}

} // namespace mirrorsync::agent
