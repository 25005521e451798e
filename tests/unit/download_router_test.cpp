#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/routing/download_router.hpp"
#include "internal/util/errors.hpp"

namespace {

using mirrorsync::db::model::MirrorFileRecord;
using mirrorsync::db::model::MirrorRecord;
using mirrorsync::routing::DownloadRouter;
using namespace mirrorsync::v1;

struct Fixture {
  std::shared_ptr<mirrorsync::db::memory::MemoryRepository> repo = std::make_shared<mirrorsync::db::memory::MemoryRepository>();
  DownloadRouter                                            router{repo, "https://origin.example/"};

  void AddMirror(const std::string& id, MirrorStatus status, uint64_t heartbeat, const std::string& tunnel = "") {
    MirrorRecord m;
    m.id                = id;
    m.name              = id;
    m.status            = status;
    m.credential        = "cred-" + id;
    m.direct_url        = "http://" + id + ".lan:8080";
    m.tunnel_url        = tunnel;
    m.max_files         = 10;
    m.last_heartbeat_ms = heartbeat;
    auto tx             = repo->Begin();
    assert(repo->InsertMirror(*tx, m));
    tx->Commit();
  }

  void Hold(const std::string& mirror_id, const std::string& entry_id,
            VerificationState state = VERIFICATION_STATE_VERIFIED) {
    MirrorFileRecord f;
    f.mirror_id = mirror_id;
    f.entry_id  = entry_id;
    f.state     = state;
    auto tx     = repo->Begin();
    assert(repo->UpsertMirrorFile(*tx, f));
    tx->Commit();
  }
};

void TestFallsBackToOriginWithoutHolders() {
  Fixture f;
  const auto route = f.router.Resolve("e1");
  assert(route.fallback);
  assert(route.mirror_id.empty());
  assert(route.url == "https://origin.example/download/e1");
}

void TestOnlyOnlineVerifiedHoldersQualify() {
  Fixture f;
  f.AddMirror("offline", MIRROR_STATUS_OFFLINE, 900);
  f.AddMirror("approved", MIRROR_STATUS_APPROVED, 0);
  f.AddMirror("partial", MIRROR_STATUS_ONLINE, 900);
  f.Hold("offline", "e1");
  f.Hold("approved", "e1");
  f.Hold("partial", "e1", VERIFICATION_STATE_UNVERIFIED);
  assert(f.router.Resolve("e1").fallback);

  f.AddMirror("good", MIRROR_STATUS_ONLINE, 100);
  f.Hold("good", "e1");
  const auto route = f.router.Resolve("e1");
  assert(!route.fallback);
  assert(route.mirror_id == "good");
  assert(route.url == "http://good.lan:8080/download/e1");
}

void TestPreferenceOrder() {
  Fixture f;
  f.AddMirror("b-fresh", MIRROR_STATUS_ONLINE, 500);
  f.AddMirror("a-stale", MIRROR_STATUS_ONLINE, 100);
  f.Hold("b-fresh", "e1");
  f.Hold("a-stale", "e1");
  assert(f.router.Resolve("e1").mirror_id == "b-fresh");

  // equal heartbeat: smaller id
  f.AddMirror("a-tied", MIRROR_STATUS_ONLINE, 500);
  f.Hold("a-tied", "e1");
  assert(f.router.Resolve("e1").mirror_id == "a-tied");

  // tunnel beats any heartbeat
  f.AddMirror("z-tunnel", MIRROR_STATUS_ONLINE, 1, "https://relay.example/z");
  f.Hold("z-tunnel", "e1");
  const auto route = f.router.Resolve("e1");
  assert(route.mirror_id == "z-tunnel");
  assert(route.url == "https://relay.example/z/download/e1");
}

void TestEmptyEntryIdIsRejected() {
  Fixture f;
  bool threw = false;
  try {
    f.router.Resolve("");
  } catch (const mirrorsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFallsBackToOriginWithoutHolders();
  TestOnlyOnlineVerifiedHoldersQualify();
  TestPreferenceOrder();
  TestEmptyEntryIdIsRejected();

  std::cout << "download_router_test: pass\n";
  return 0;
}
