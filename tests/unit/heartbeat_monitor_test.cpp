#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/util/errors.hpp"

namespace {

using mirrorsync::db::model::MirrorFileRecord;
using mirrorsync::db::model::MirrorRecord;
using mirrorsync::heartbeat::HeartbeatMonitor;
using mirrorsync::heartbeat::HeartbeatOptions;
using namespace mirrorsync::v1;

constexpr uint64_t kInterval = 60'000;

struct Fixture {
  std::shared_ptr<mirrorsync::db::memory::MemoryRepository> repo = std::make_shared<mirrorsync::db::memory::MemoryRepository>();
  uint64_t                                                  now  = 10'000'000;
  HeartbeatMonitor                                          monitor;

  Fixture() : monitor(repo, Options(), [this] { return now; }) {
  }

  static HeartbeatOptions Options() {
    HeartbeatOptions options;
    options.interval           = std::chrono::milliseconds(kInterval);
    options.timeout_multiplier = 3;
    return options;
  }

  void AddMirror(const std::string& id, MirrorStatus status) {
    MirrorRecord m;
    m.id         = id;
    m.name       = id;
    m.status     = status;
    m.credential = "cred-" + id;
    m.direct_url = "http://" + id + ":8080";
    m.max_files  = 5;
    auto tx      = repo->Begin();
    assert(repo->InsertMirror(*tx, m));
    tx->Commit();
  }

  MirrorRecord Get(const std::string& id) {
    auto tx = repo->Begin();
    return *repo->GetMirror(*tx, id);
  }
};

MirrorCounters Counters(uint64_t files) {
  MirrorCounters c;
  c.set_file_count(files);
  return c;
}

void TestFirstHeartbeatBringsApprovedOnline() {
  Fixture f;
  f.AddMirror("m1", MIRROR_STATUS_APPROVED);

  const auto [id, status] = f.monitor.RecordHeartbeat("cred-m1", Counters(4));
  assert(id == "m1");
  assert(status == MIRROR_STATUS_ONLINE);

  const auto m = f.Get("m1");
  assert(m.last_heartbeat_ms == f.now);
  assert(m.reported_files == 4);
}

void TestHeartbeatCarriesCurrentCapacity() {
  Fixture f;
  f.AddMirror("m1", MIRROR_STATUS_APPROVED);

  auto counters = Counters(2);
  counters.set_max_files(2);
  f.monitor.RecordHeartbeat("cred-m1", counters);
  assert(f.Get("m1").max_files == 2);

  // an agent that does not report capacity leaves it alone
  f.monitor.RecordHeartbeat("cred-m1", Counters(2));
  assert(f.Get("m1").max_files == 2);
}

void TestSweepHonoursTimeoutWindow() {
  Fixture f;
  f.AddMirror("m1", MIRROR_STATUS_APPROVED);
  f.monitor.RecordHeartbeat("cred-m1", Counters(0));

  // just inside the window
  f.now += 3 * kInterval - 1;
  assert(f.monitor.Sweep().empty());
  assert(f.Get("m1").status == MIRROR_STATUS_ONLINE);

  f.now += 1;
  const auto offline = f.monitor.Sweep();
  assert(offline.size() == 1 && offline[0] == "m1");
  assert(f.Get("m1").status == MIRROR_STATUS_OFFLINE);

  // already offline, nothing more to do
  assert(f.monitor.Sweep().empty());
}

void TestOfflineKeepsFilesAndRecovers() {
  Fixture f;
  f.AddMirror("m1", MIRROR_STATUS_APPROVED);
  f.monitor.RecordHeartbeat("cred-m1", Counters(1));
  {
    MirrorFileRecord file;
    file.mirror_id    = "m1";
    file.entry_id     = "e1";
    file.state        = VERIFICATION_STATE_VERIFIED;
    file.synced_at_ms = f.now;
    auto tx           = f.repo->Begin();
    assert(f.repo->UpsertMirrorFile(*tx, file));
    tx->Commit();
  }

  f.now += 10 * kInterval;
  f.monitor.Sweep();
  assert(f.Get("m1").status == MIRROR_STATUS_OFFLINE);
  {
    auto tx = f.repo->Begin();
    assert(f.repo->ListMirrorFiles(*tx, "m1").size() == 1);
  }

  const auto [_, status] = f.monitor.RecordHeartbeat("cred-m1", Counters(1));
  assert(status == MIRROR_STATUS_ONLINE);
}

void TestApprovedWithoutHeartbeatIsNotSwept() {
  Fixture f;
  f.AddMirror("m1", MIRROR_STATUS_APPROVED);
  f.now += 100 * kInterval;
  assert(f.monitor.Sweep().empty());
  assert(f.Get("m1").status == MIRROR_STATUS_APPROVED);
}

void TestUntrackedMirrorsAreRefused() {
  Fixture f;
  f.AddMirror("pending", MIRROR_STATUS_PENDING);
  f.AddMirror("rejected", MIRROR_STATUS_REJECTED);

  for (const char* cred : {"cred-pending", "cred-rejected"}) {
    bool threw = false;
    try {
      f.monitor.RecordHeartbeat(cred, Counters(0));
    } catch (const mirrorsync::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
  }
  assert(f.Get("pending").status == MIRROR_STATUS_PENDING);
  assert(f.Get("rejected").last_heartbeat_ms == 0);

  bool threw = false;
  try {
    f.monitor.RecordHeartbeat("who-dis", Counters(0));
  } catch (const mirrorsync::util::Unauthenticated&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFirstHeartbeatBringsApprovedOnline();
  TestHeartbeatCarriesCurrentCapacity();
  TestSweepHonoursTimeoutWindow();
  TestOfflineKeepsFilesAndRecovers();
  TestApprovedWithoutHeartbeatIsNotSwept();
  TestUntrackedMirrorsAreRefused();

  std::cout << "heartbeat_monitor_test: pass\n";
  return 0;
}
