#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using mirrorsync::db::ErrorCode;
using mirrorsync::db::Repository;
using mirrorsync::db::model::CatalogEntryRecord;
using mirrorsync::db::model::MirrorFileRecord;
using mirrorsync::db::model::MirrorRecord;
using mirrorsync::db::model::PairingCodeRecord;
using mirrorsync::db::model::SyncLogRecord;
using mirrorsync::runtime::config::RuntimeConfig;
using namespace mirrorsync::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  bool                                         supports_restart = false;
  std::function<void()>                        cleanup;
};

// ids are prefixed so a shared postgres database can be reused between runs
std::string Id(const std::string& prefix, const std::string& suffix) {
  return prefix + "-" + suffix;
}

MirrorRecord Mirror(const std::string& id, uint64_t created_at) {
  MirrorRecord m;
  m.id            = id;
  m.name          = "name-" + id;
  m.status        = MIRROR_STATUS_PENDING;
  m.credential    = "cred-" + id;
  m.direct_url    = "http://" + id + ":8080";
  m.max_files     = 7;
  m.created_at_ms = created_at;
  return m;
}

void VerifyMirrorRegistry(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();

  assert(repo.InsertMirror(*tx, Mirror(Id(p, "b"), 100)));
  assert(repo.InsertMirror(*tx, Mirror(Id(p, "a"), 100)));
  assert(repo.InsertMirror(*tx, Mirror(Id(p, "c"), 50)));

  auto found = repo.FindMirrorByCredential(*tx, "cred-" + Id(p, "b"));
  assert(found && found->id == Id(p, "b"));
  assert(!repo.FindMirrorByCredential(*tx, "cred-nobody"));

  // created_at, then id
  std::vector<std::string> order;
  for (const auto& m : repo.ListMirrors(*tx)) {
    if (m.id.rfind(p, 0) == 0) order.push_back(m.id);
  }
  assert((order == std::vector<std::string>{Id(p, "c"), Id(p, "a"), Id(p, "b")}));

  auto m               = *repo.GetMirror(*tx, Id(p, "a"));
  m.status             = MIRROR_STATUS_ONLINE;
  m.tunnel_url         = "https://relay/" + m.id;
  m.last_heartbeat_ms  = 12345;
  m.last_sync_ms       = 23456;
  m.reported_files     = 3;
  assert(repo.UpdateMirror(*tx, m));

  const auto read = repo.GetMirror(*tx, Id(p, "a"));
  assert(read->status == MIRROR_STATUS_ONLINE);
  assert(read->tunnel_url == m.tunnel_url);
  assert(read->last_heartbeat_ms == 12345 && read->last_sync_ms == 23456);
  assert(read->reported_files == 3 && read->max_files == 7);

  const auto missing = repo.UpdateMirror(*tx, Mirror(Id(p, "ghost"), 1));
  assert(missing.code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyPairingCodes(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();

  const uint64_t now = 1'000'000;
  PairingCodeRecord live{Id(p, "LIVE"), now, now + 1000, false, ""};
  PairingCodeRecord stale{Id(p, "STALE"), now - 5000, now - 1, false, ""};
  PairingCodeRecord used{Id(p, "USED"), now - 5000, now - 1, true, "m1"};
  assert(repo.InsertPairingCode(*tx, live));
  assert(repo.InsertPairingCode(*tx, stale));
  assert(repo.InsertPairingCode(*tx, used));

  const auto before = repo.CountOutstandingPairingCodes(*tx, now);
  assert(before >= 1);

  live.consumed  = true;
  live.mirror_id = "m2";
  assert(repo.UpdatePairingCode(*tx, live));
  assert(repo.CountOutstandingPairingCodes(*tx, now) == before - 1);

  const auto read = repo.GetPairingCode(*tx, Id(p, "LIVE"));
  assert(read && read->consumed && read->mirror_id == "m2");

  assert(repo.DeleteExpiredPairingCodes(*tx, now) >= 1);
  assert(!repo.GetPairingCode(*tx, Id(p, "STALE")));
  assert(repo.GetPairingCode(*tx, Id(p, "USED")));

  tx->Commit();
}

void VerifyMirrorFiles(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();

  const auto entry = Id(p, "entry");
  for (const auto& mirror : {Id(p, "m2"), Id(p, "m1")}) {
    MirrorFileRecord f;
    f.mirror_id    = mirror;
    f.entry_id     = entry;
    f.state        = VERIFICATION_STATE_VERIFIED;
    f.synced_at_ms = 10;
    f.size_bytes   = 4096;
    f.content_hash = "abc";
    f.popularity   = 9;
    assert(repo.UpsertMirrorFile(*tx, f));
  }
  MirrorFileRecord other;
  other.mirror_id = Id(p, "m1");
  other.entry_id  = Id(p, "aaa");
  other.state     = VERIFICATION_STATE_UNVERIFIED;
  assert(repo.UpsertMirrorFile(*tx, other));

  auto holders = repo.ListHoldersOf(*tx, entry);
  assert(holders.size() == 2);
  assert(holders[0].mirror_id == Id(p, "m1"));

  auto files = repo.ListMirrorFiles(*tx, Id(p, "m1"));
  assert(files.size() == 2);
  assert(files[0].entry_id == Id(p, "aaa"));
  assert(files[1].content_hash == "abc" && files[1].popularity == 9 && files[1].size_bytes == 4096);

  // upsert overwrites in place
  files[1].download_count = 4;
  assert(repo.UpsertMirrorFile(*tx, files[1]));
  assert(repo.GetMirrorFile(*tx, Id(p, "m1"), entry)->download_count == 4);
  assert(repo.ListMirrorFiles(*tx, Id(p, "m1")).size() == 2);

  assert(repo.DeleteMirrorFile(*tx, Id(p, "m1"), entry));
  assert(!repo.GetMirrorFile(*tx, Id(p, "m1"), entry));
  assert(repo.ListHoldersOf(*tx, entry).size() == 1);

  tx->Commit();
}

void VerifySyncLog(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();

  uint64_t last_seq = 0;
  for (int i = 0; i < 4; ++i) {
    SyncLogRecord r;
    r.mirror_id = Id(p, i % 2 == 0 ? "even" : "odd");
    r.entry_id  = "e" + std::to_string(i);
    r.action    = i == 3 ? SYNC_ACTION_VERIFY_FAIL : SYNC_ACTION_PUSH;
    r.at_ms     = 100 + i;
    r.detail    = i == 3 ? "hash mismatch" : "";
    assert(repo.AppendSyncLog(*tx, r));
    assert(r.seq > last_seq);
    last_seq = r.seq;
  }

  const auto odd = repo.ListSyncLog(*tx, Id(p, "odd"), 0);
  assert(odd.size() == 2);
  assert(odd[0].entry_id == "e3" && odd[0].action == SYNC_ACTION_VERIFY_FAIL && odd[0].detail == "hash mismatch");
  assert(odd[1].entry_id == "e1");

  const auto newest = repo.ListSyncLog(*tx, "", 1);
  assert(newest.size() == 1 && newest[0].seq == last_seq);

  tx->Commit();
}

void VerifyCatalogAndSettings(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();

  CatalogEntryRecord e{Id(p, "cat1"), "d41d8cd98f00b204e9800998ecf8427e", 0, 5, 77, false, "empty.bin"};
  assert(repo.UpsertCatalogEntry(*tx, e));
  e.approved = true;
  assert(repo.UpsertCatalogEntry(*tx, e));
  CatalogEntryRecord hidden{Id(p, "cat2"), "x", 1, 0, 78, false, "hidden.bin"};
  assert(repo.UpsertCatalogEntry(*tx, hidden));

  const auto approved = repo.ListCatalogEntries(*tx, true);
  assert(std::any_of(approved.begin(), approved.end(), [&](const auto& r) { return r.id == e.id && r.filename == "empty.bin"; }));
  assert(std::none_of(approved.begin(), approved.end(), [&](const auto& r) { return r.id == hidden.id; }));
  assert(repo.GetCatalogEntry(*tx, hidden.id)->created_at_ms == 78);

  assert(repo.PutSetting(*tx, Id(p, "key"), "v1"));
  assert(repo.PutSetting(*tx, Id(p, "key"), "v2"));
  assert(*repo.GetSetting(*tx, Id(p, "key")) == "v2");
  assert(!repo.GetSetting(*tx, Id(p, "absent")));

  tx->Commit();
}

void VerifyRollback(Repository& repo, const std::string& p) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, Mirror(Id(p, "rolled"), 1)));
    assert(repo.PutSetting(*tx, Id(p, "rolled"), "x"));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, Mirror(Id(p, "dropped"), 1)));
  }

  auto tx = repo.Begin();
  assert(!repo.GetMirror(*tx, Id(p, "rolled")));
  assert(!repo.GetSetting(*tx, Id(p, "rolled")));
  assert(!repo.GetMirror(*tx, Id(p, "dropped")));
  tx->Commit();
}

// A failed statement poisons a postgres transaction, so each conflict gets its own.
void VerifyDuplicatesRejected(Repository& repo, const std::string& p) {
  {
    auto       tx        = repo.Begin();
    const auto duplicate = repo.InsertMirror(*tx, Mirror(Id(p, "a"), 1));
    assert(duplicate.code == ErrorCode::AlreadyExists);
    assert(!duplicate.Transient());
    bool threw = false;
    try {
      mirrorsync::db::ThrowIfDbError(duplicate, "insert mirror");
    } catch (const mirrorsync::util::InvalidState& e) {
      threw = std::string(e.what()).find("insert mirror: already exists") == 0;
    }
    assert(threw);
    tx->Rollback();
  }
  {
    auto tx    = repo.Begin();
    auto clash = Mirror(Id(p, "fresh"), 1);
    clash.credential = "cred-" + Id(p, "b");
    assert(!repo.InsertMirror(*tx, clash));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(!repo.InsertPairingCode(*tx, PairingCodeRecord{Id(p, "LIVE"), 1, 2, false, ""}));
    tx->Rollback();
  }
}

// Two threads with open transactions at the same time: a sync reconcile and a
// heartbeat, say. The second Begin() must wait or snapshot, never fail.
// Memory transactions may lose the commit race; the caller retries as the
// background loops do.
void VerifyOverlappingTransactions(Repository& repo, const std::string& p) {
  std::promise<void> first_open;
  auto               first_opened = first_open.get_future();

  auto first = std::async(std::launch::async, [&] {
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, Mirror(Id(p, "overlap-1"), 1)));
    first_open.set_value();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    tx->Commit();
  });

  auto second = std::async(std::launch::async, [&] {
    first_opened.wait();
    for (int attempt = 0;; ++attempt) {
      auto tx = repo.Begin();
      if (!repo.GetMirror(*tx, Id(p, "overlap-2"))) {
        assert(repo.InsertMirror(*tx, Mirror(Id(p, "overlap-2"), 2)));
      }
      try {
        tx->Commit();
        return;
      } catch (const std::runtime_error&) {
        if (attempt > 0) throw;
      }
    }
  });

  first.get();
  second.get();

  auto tx = repo.Begin();
  assert(repo.GetMirror(*tx, Id(p, "overlap-1")));
  assert(repo.GetMirror(*tx, Id(p, "overlap-2")));
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& p) {
  if (!backend.supports_restart) return;

  {
    auto repo = backend.make_repository();
    auto tx   = repo->Begin();
    assert(repo->InsertMirror(*tx, Mirror(Id(p, "durable"), 5)));
    assert(repo->PutSetting(*tx, Id(p, "credential"), "secret"));
    SyncLogRecord r{0, Id(p, "durable"), "e1", SYNC_ACTION_EVICT, 9, "over capacity"};
    assert(repo->AppendSyncLog(*tx, r));
    tx->Commit();
  }

  auto repo = backend.make_repository();
  auto tx   = repo->Begin();
  assert(repo->GetMirror(*tx, Id(p, "durable")));
  assert(*repo->GetSetting(*tx, Id(p, "credential")) == "secret");
  const auto log = repo->ListSyncLog(*tx, Id(p, "durable"), 0);
  assert(log.size() == 1 && log[0].detail == "over capacity");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = [] { return mirrorsync::factory::BuildRepository(RuntimeConfig{}); },
      .supports_restart = false,
      .cleanup          = [] {},
  };
}

#if MIRRORSYNC_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = (std::filesystem::temp_directory_path() / ("mirrorsync_parity_" + std::to_string(NowMs()) + ".db")).string();

  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path);
  config.mutable_database()->mutable_sqlite()->set_wal_mode(true);

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = [config] { return mirrorsync::factory::BuildRepository(config); },
      .supports_restart = true,
      .cleanup =
          [db_path] {
            std::error_code ec;
            for (const char* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(db_path + suffix, ec);
          },
  };
}
#endif

#if MIRRORSYNC_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("MIRRORSYNC_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("MIRRORSYNC_TEST_POSTGRES_URI is not set");
  }

  RuntimeConfig config;
  config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
  config.mutable_database()->mutable_postgres()->set_pool_size(4);

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = [config] { return mirrorsync::factory::BuildRepository(config); },
      .supports_restart = true,
      .cleanup          = [] {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto prefix = backend.name + std::to_string(NowMs());
  auto       repo   = backend.make_repository();

  VerifyMirrorRegistry(*repo, prefix);
  VerifyPairingCodes(*repo, prefix);
  VerifyMirrorFiles(*repo, prefix);
  VerifySyncLog(*repo, prefix);
  VerifyCatalogAndSettings(*repo, prefix);
  VerifyRollback(*repo, prefix);
  VerifyDuplicatesRejected(*repo, prefix);
  VerifyOverlappingTransactions(*repo, prefix);
  repo.reset();

  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if MIRRORSYNC_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if MIRRORSYNC_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "repository_parity_test: pass\n";
  return 0;
}
