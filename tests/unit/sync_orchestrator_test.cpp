#include <cassert>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>

#include "internal/agent/mirror_agent.hpp"
#include "internal/agent/origin_link.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/storage/disk/disk_content_store.hpp"
#include "internal/sync/sync_orchestrator.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/secrets.hpp"

namespace {

using mirrorsync::db::model::CatalogEntryRecord;
using mirrorsync::db::model::MirrorRecord;
using mirrorsync::sync::SyncOrchestrator;
using mirrorsync::sync::SyncPassOutcome;
using namespace mirrorsync::v1;

// Behaves like a well-formed mirror: applies evictions, fetches everything
// except entries marked corrupt, and reports what it holds afterwards.
class FakeMirror final : public mirrorsync::sync::MirrorTransport {
 public:
  ApplySyncResponse ApplySync(const MirrorRecord&, const ApplySyncRequest& request) override {
    ++calls;
    if (entered) {
      entered->set_value();
      entered.reset();
      release.wait();
    }
    if (unreachable) throw mirrorsync::util::Unreachable("connect: connection refused");

    ApplySyncResponse response;
    for (const auto& id : request.evict()) {
      if (held.erase(id) > 0) AddOutcome(response, id, SYNC_ACTION_EVICT, "");
    }
    for (const auto& e : request.retain()) held[e.id()] = e;
    for (const auto& e : request.fetch()) {
      if (corrupt.contains(e.id())) {
        AddOutcome(response, e.id(), SYNC_ACTION_VERIFY_FAIL, "hash mismatch");
        continue;
      }
      held[e.id()] = e;
      AddOutcome(response, e.id(), SYNC_ACTION_PUSH, "");
    }
    for (const auto& [_, e] : held) *response.add_holdings() = e;
    last_request = request;
    return response;
  }

  static void AddOutcome(ApplySyncResponse& response, const std::string& id, SyncAction action, const std::string& detail) {
    auto* o = response.add_outcomes();
    o->set_entry_id(id);
    o->set_action(action);
    o->set_detail(detail);
  }

  std::map<std::string, CatalogEntry> held;
  std::set<std::string>               corrupt;
  bool                                unreachable = false;
  int                                 calls       = 0;
  ApplySyncRequest                    last_request;

  std::optional<std::promise<void>> entered;
  std::shared_future<void>          release;
};

// Archive side of the link for an in-process agent; counts transfers.
class ArchiveOrigin final : public mirrorsync::agent::OriginLink {
 public:
  RedeemResponse Redeem(const RedeemRequest&) override {
    RedeemResponse resp;
    resp.set_mirror_id("m1");
    resp.set_credential("cred");
    return resp;
  }

  MirrorStatus Heartbeat(const std::string&, const MirrorCounters&) override {
    return MIRROR_STATUS_ONLINE;
  }

  void FetchContent(const std::string&, const std::string& entry_id, const std::function<void(std::string_view)>& sink) override {
    ++fetches;
    sink(content.at(entry_id));
  }

  TriggerSyncResponse TriggerSync(const std::string&, const std::string&) override {
    return TriggerSyncResponse{};
  }

  std::map<std::string, std::string> content;
  int                                fetches = 0;
};

class AgentTransport final : public mirrorsync::sync::MirrorTransport {
 public:
  explicit AgentTransport(mirrorsync::agent::MirrorAgent& agent) : agent_(agent) {
  }

  ApplySyncResponse ApplySync(const MirrorRecord& mirror, const ApplySyncRequest& request) override {
    return agent_.ApplySync(mirror.credential, request);
  }

 private:
  mirrorsync::agent::MirrorAgent& agent_;
};

struct Fixture {
  std::shared_ptr<mirrorsync::db::memory::MemoryRepository> repo   = std::make_shared<mirrorsync::db::memory::MemoryRepository>();
  std::shared_ptr<FakeMirror>                               mirror = std::make_shared<FakeMirror>();
  SyncOrchestrator                                          orchestrator{repo, mirror, [] { return uint64_t{5'000}; }};

  void AddMirror(MirrorStatus status, uint64_t max_files) {
    MirrorRecord m;
    m.id         = "m1";
    m.name       = "edge";
    m.status     = status;
    m.credential = "cred";
    m.direct_url = "http://edge:8080";
    m.max_files  = max_files;
    auto tx      = repo->Begin();
    assert(repo->InsertMirror(*tx, m));
    tx->Commit();
  }

  void SetStatus(MirrorStatus status) {
    auto tx = repo->Begin();
    auto m  = repo->GetMirror(*tx, "m1");
    m->status = status;
    assert(repo->UpdateMirror(*tx, *m));
    tx->Commit();
  }

  void AddEntry(const std::string& id, uint64_t downloads, bool approved = true) {
    CatalogEntryRecord e;
    e.id             = id;
    e.content_hash   = "hash-" + id;
    e.size_bytes     = 100;
    e.download_count = downloads;
    e.created_at_ms  = 1'000;
    e.approved       = approved;
    e.filename       = id + ".bin";
    auto tx          = repo->Begin();
    assert(repo->UpsertCatalogEntry(*tx, e));
    tx->Commit();
  }

  std::set<std::string> Rows() {
    auto                  tx = repo->Begin();
    std::set<std::string> ids;
    for (const auto& f : repo->ListMirrorFiles(*tx, "m1")) ids.insert(f.entry_id);
    return ids;
  }
};

void TestComputeDelta() {
  auto entry = [](const std::string& id, uint64_t downloads) {
    CatalogEntryRecord e;
    e.id             = id;
    e.download_count = downloads;
    return e;
  };
  const std::vector<CatalogEntryRecord> catalog{entry("a", 50), entry("b", 10), entry("c", 5), entry("d", 1)};

  std::vector<mirrorsync::db::model::MirrorFileRecord> held(2);
  held[0].entry_id = "b";
  held[1].entry_id = "d";

  const auto delta = mirrorsync::sync::ComputeDelta(catalog, 3, held);
  assert(delta.fetch.size() == 2 && delta.fetch[0].id == "a" && delta.fetch[1].id == "c");
  assert(delta.evict.size() == 1 && delta.evict[0] == "d");
  assert(delta.retain.size() == 1 && delta.retain[0].id == "b");

  assert(mirrorsync::sync::ComputeDelta(catalog, 0, {}).Empty());
}

void TestPassFillsToCapacityThenIsIdempotent() {
  Fixture f;
  f.AddMirror(MIRROR_STATUS_ONLINE, 3);
  f.AddEntry("a", 50);
  f.AddEntry("b", 10);
  f.AddEntry("c", 5);
  f.AddEntry("d", 1);
  f.AddEntry("hidden", 999, false);

  auto report = f.orchestrator.RunPass("m1");
  assert(report.outcome == SyncPassOutcome::kSynced);
  assert(report.pushed == 3 && report.failed == 0);
  assert((f.Rows() == std::set<std::string>{"a", "b", "c"}));

  report = f.orchestrator.RunPass("m1");
  assert(report.outcome == SyncPassOutcome::kUnchanged);
  assert(f.mirror->calls == 1);

  // a new popular entry displaces the weakest holding
  f.AddEntry("e", 20);
  report = f.orchestrator.RunPass("m1");
  assert(report.pushed == 1 && report.evicted == 1);
  assert((f.Rows() == std::set<std::string>{"a", "b", "e"}));
  assert(f.mirror->last_request.evict_size() == 1 && f.mirror->last_request.evict(0) == "c");

  auto tx  = f.repo->Begin();
  auto log = f.repo->ListSyncLog(*tx, "m1", 0);
  assert(log.size() == 5);
  assert(log.front().action == SYNC_ACTION_PUSH || log.front().action == SYNC_ACTION_EVICT);
  assert(f.repo->GetMirror(*tx, "m1")->last_sync_ms == 5'000);
}

void TestIneligibleMirrorsAreSkipped() {
  Fixture f;
  f.AddMirror(MIRROR_STATUS_PENDING, 3);
  f.AddEntry("a", 1);

  assert(f.orchestrator.RunPass("m1").outcome == SyncPassOutcome::kSkipped);
  f.SetStatus(MIRROR_STATUS_APPROVED);
  assert(f.orchestrator.RunPass("m1").outcome == SyncPassOutcome::kSynced);
  f.SetStatus(MIRROR_STATUS_ONLINE);
  f.SetStatus(MIRROR_STATUS_OFFLINE);
  f.AddEntry("b", 2);
  assert(f.orchestrator.RunPass("m1").outcome == SyncPassOutcome::kSkipped);
  assert(f.mirror->calls == 1);

  // offline keeps rows
  assert(f.Rows().size() == 1);

  bool threw = false;
  try {
    f.orchestrator.RunPass("nope");
  } catch (const mirrorsync::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestUnreachableMirrorLogsEachFetch() {
  Fixture f;
  f.AddMirror(MIRROR_STATUS_ONLINE, 5);
  f.AddEntry("a", 3);
  f.AddEntry("b", 2);
  f.mirror->unreachable = true;

  const auto report = f.orchestrator.RunPass("m1");
  assert(report.outcome == SyncPassOutcome::kUnreachable);
  assert(report.failed == 2);
  assert(f.Rows().empty());

  auto tx  = f.repo->Begin();
  auto log = f.repo->ListSyncLog(*tx, "m1", 0);
  assert(log.size() == 2);
  for (const auto& e : log) {
    assert(e.action == SYNC_ACTION_FETCH_FAIL);
    assert(e.detail.find("connection refused") != std::string::npos);
  }

  // retried on the next pass
  f.mirror->unreachable = false;
  tx->Commit();
  assert(f.orchestrator.RunPass("m1").pushed == 2);
}

void TestVerifyFailureNeverBecomesARow() {
  Fixture f;
  f.AddMirror(MIRROR_STATUS_ONLINE, 5);
  f.AddEntry("good", 3);
  f.AddEntry("bad", 2);
  f.mirror->corrupt.insert("bad");

  const auto report = f.orchestrator.RunPass("m1");
  assert(report.pushed == 1 && report.failed == 1);
  assert((f.Rows() == std::set<std::string>{"good"}));

  auto tx  = f.repo->Begin();
  auto log = f.repo->ListSyncLog(*tx, "m1", 1);
  assert(log.size() == 1);
}

void TestHoldingsAreClampedToCapacity() {
  Fixture f;
  f.AddMirror(MIRROR_STATUS_ONLINE, 2);
  f.AddEntry("a", 3);
  f.AddEntry("b", 2);
  f.AddEntry("c", 1);

  // a misbehaving mirror that claims it kept an extra file
  CatalogEntry extra;
  extra.set_id("c");
  extra.set_download_count(1);
  f.mirror->held["c"] = extra;

  f.orchestrator.RunPass("m1");
  assert((f.Rows() == std::set<std::string>{"a", "b"}));
}

void TestConcurrentPassForSameMirrorIsRefused() {
  Fixture f;
  f.AddMirror(MIRROR_STATUS_ONLINE, 2);
  f.AddEntry("a", 1);

  std::promise<void> release;
  f.mirror->release = release.get_future().share();
  f.mirror->entered.emplace();
  auto entered      = f.mirror->entered->get_future();

  std::thread first([&] { f.orchestrator.RunPass("m1"); });
  entered.wait();
  assert(f.orchestrator.InFlight("m1"));

  bool threw = false;
  try {
    f.orchestrator.RunPass("m1");
  } catch (const mirrorsync::util::AlreadyRunning&) {
    threw = true;
  }
  assert(threw);

  release.set_value();
  first.join();
  assert(!f.orchestrator.InFlight("m1"));
  assert((f.Rows() == std::set<std::string>{"a"}));
}

} // namespace

void TestLoweredAgentCapacityConverges() {
  Fixture f;
  // declared at pairing; the node has since been reconfigured to 2
  f.AddMirror(MIRROR_STATUS_ONLINE, 3);

  auto origin = std::make_shared<ArchiveOrigin>();
  for (const auto& [id, downloads] : std::map<std::string, uint64_t>{{"a", 50}, {"b", 10}, {"c", 5}}) {
    const std::string data(64, id[0]);
    origin->content[id] = data;
    mirrorsync::util::ContentHasher hasher("md5");
    hasher.Update(data.data(), data.size());

    CatalogEntryRecord e;
    e.id             = id;
    e.content_hash   = hasher.FinalHex();
    e.size_bytes     = data.size();
    e.download_count = downloads;
    e.created_at_ms  = 1'000;
    e.approved       = true;
    e.filename       = id + ".bin";
    auto tx          = f.repo->Begin();
    assert(f.repo->UpsertCatalogEntry(*tx, e));
    tx->Commit();
  }

  const auto root = std::filesystem::temp_directory_path() / ("sync_orchestrator_test_" + mirrorsync::util::RandomToken(4));
  mirrorsync::agent::AgentOptions options;
  options.mirror_name = "edge";
  options.max_files   = 2;
  options.direct_url  = "http://edge:8080";
  mirrorsync::agent::MirrorAgent agent(std::make_shared<mirrorsync::db::memory::MemoryRepository>(),
                                       std::make_shared<mirrorsync::storage::DiskContentStore>(root), origin, options,
                                       [] { return uint64_t{5'000}; });
  agent.Pair("CODE", "", "");

  SyncOrchestrator orchestrator(f.repo, std::make_shared<AgentTransport>(agent), [] { return uint64_t{5'000}; });

  auto report = orchestrator.RunPass("m1");
  assert(report.outcome == SyncPassOutcome::kSynced);
  assert(report.pushed == 2 && report.failed == 1);
  assert((f.Rows() == std::set<std::string>{"a", "b"}));
  assert(origin->fetches == 2);

  // still asked for c, but the node turns it down without downloading it
  report = orchestrator.RunPass("m1");
  assert(report.failed == 1);
  assert(origin->fetches == 2);

  mirrorsync::heartbeat::HeartbeatMonitor monitor(f.repo, mirrorsync::heartbeat::HeartbeatOptions{}, [] { return uint64_t{5'000}; });
  monitor.RecordHeartbeat("cred", agent.Counters());

  report = orchestrator.RunPass("m1");
  assert(report.outcome == SyncPassOutcome::kUnchanged);
  assert(origin->fetches == 2);
  assert((f.Rows() == std::set<std::string>{"a", "b"}));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}

int main() {
  TestComputeDelta();
  TestPassFillsToCapacityThenIsIdempotent();
  TestIneligibleMirrorsAreSkipped();
  TestUnreachableMirrorLogsEachFetch();
  TestVerifyFailureNeverBecomesARow();
  TestHoldingsAreClampedToCapacity();
  TestConcurrentPassForSameMirrorIsRefused();
  TestLoweredAgentCapacityConverges();

  std::cout << "sync_orchestrator_test: pass\n";
  return 0;
}
