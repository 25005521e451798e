#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "client/cpp/mirror_client.h"
#include "client/cpp/origin_client.h"
#include "internal/agent/heartbeat_sender.hpp"
#include "internal/agent/mirror_agent.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "internal/storage/content_store.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/secrets.hpp"

namespace {

using mirrorsync::runtime::config::RuntimeConfig;
using namespace mirrorsync::v1;
using namespace std::chrono_literals;

constexpr const char* kAdminToken = "integration-admin-token";

bool WaitFor(const std::function<bool()>& done, std::chrono::seconds limit = 30s) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) return true;
    std::this_thread::sleep_for(50ms);
  }
  return done();
}

std::shared_ptr<::grpc::Channel> Dial(int port) {
  return ::grpc::CreateChannel("127.0.0.1:" + std::to_string(port), ::grpc::InsecureChannelCredentials());
}

// Writes the archive file and its approved catalog row.
void Publish(mirrorsync::factory::OriginApplication& origin, const std::string& id, const std::string& data, uint64_t downloads) {
  auto writer = origin.archive->Stage(id + ".bin");
  writer->Append(data.data(), data.size());
  writer->Commit(true);

  mirrorsync::util::ContentHasher hasher("md5");
  hasher.Update(data.data(), data.size());

  mirrorsync::db::model::CatalogEntryRecord entry;
  entry.id             = id;
  entry.content_hash   = hasher.FinalHex();
  entry.size_bytes     = data.size();
  entry.download_count = downloads;
  entry.created_at_ms  = 1'700'000'000'000;
  entry.approved       = true;
  entry.filename       = id + ".bin";

  auto tx = origin.repository->Begin();
  assert(origin.repository->UpsertCatalogEntry(*tx, entry));
  tx->Commit();
}

std::set<std::string> Held(const mirrorsync::client::MirrorClient& mirror, const std::string& credential) {
  std::set<std::string> ids;
  for (const auto& f : mirror.ListFiles(credential).files()) ids.insert(f.entry_id());
  return ids;
}

struct TempDir {
  std::filesystem::path path = std::filesystem::temp_directory_path() / ("mirrorsync_roundtrip_" + mirrorsync::util::RandomToken(4));
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

void TestPairApproveSyncServe() {
  TempDir dir;

  RuntimeConfig origin_config;
  origin_config.mutable_server()->set_bind_address("127.0.0.1:0");
  auto* origin_section = origin_config.mutable_origin();
  origin_section->set_archive_path((dir.path / "archive").string());
  origin_section->set_public_url("https://origin.example");
  origin_section->set_admin_token(kAdminToken);
  origin_section->mutable_sync()->set_workers(2);
  origin_section->mutable_sync()->set_sync_on_catalog_change(true);
  origin_section->mutable_sync()->mutable_rpc_timeout()->set_seconds(30);

  auto origin = mirrorsync::factory::BuildOrigin(origin_config);
  mirrorsync::runtime::Server origin_server(origin_config.server().bind_address(), origin.grpc_services);
  origin_server.Start();
  origin.Start();

  Publish(origin, "alpha", std::string(200'000, 'a'), 50);
  Publish(origin, "bravo", "bravo bytes", 10);
  Publish(origin, "charlie", "charlie bytes", 1);

  RuntimeConfig agent_config;
  agent_config.mutable_server()->set_bind_address("127.0.0.1:0");
  auto* agent_section = agent_config.mutable_agent();
  agent_section->set_origin_url("127.0.0.1:" + std::to_string(origin_server.Port()));
  agent_section->set_mirror_name("edge-it");
  agent_section->set_storage_path((dir.path / "replicas").string());
  agent_section->set_max_files(2);

  auto agent = mirrorsync::factory::BuildAgent(agent_config);
  mirrorsync::runtime::Server agent_server(agent.bind_address, agent.grpc_services);
  agent_server.Start();
  agent.Start();

  mirrorsync::client::OriginClient admin(Dial(origin_server.Port()), 10s, 30s);
  mirrorsync::client::MirrorClient mirror(Dial(agent_server.Port()), 10s);

  // pairing: operator issues a code, the node redeems it through its own endpoint
  const auto code   = admin.IssuePairingCode(kAdminToken);
  const auto paired = mirror.Pair(code.code(), "127.0.0.1:" + std::to_string(agent_server.Port()), "");
  assert(!paired.mirror_id().empty());
  assert(mirror.Health().paired());

  auto listed = admin.ListMirrors(kAdminToken);
  assert(listed.mirrors_size() == 1);
  assert(listed.mirrors(0).status() == MIRROR_STATUS_PENDING);

  // pending mirrors get no heartbeat tracking and no content
  assert(!agent.heartbeat->SendOnce());
  bool threw = false;
  try {
    mirror.Pair(code.code(), "", "");
  } catch (const mirrorsync::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  // approval queues the first pass; the top two entries arrive verified
  admin.ApproveMirror(kAdminToken, paired.mirror_id());
  const auto credential = paired.credential();
  assert(WaitFor([&] { return Held(mirror, credential) == std::set<std::string>{"alpha", "bravo"}; }));
  assert(WaitFor([&] { return origin.registry->HeldFiles(paired.mirror_id()) == 2; }));

  assert(agent.heartbeat->SendOnce());
  const auto status = admin.GetMirrorStatus(kAdminToken, paired.mirror_id());
  assert(status.mirror().status() == MIRROR_STATUS_ONLINE);
  assert(status.mirror().reported_files() == 2);
  assert(status.recent_log_size() >= 2);

  // routing prefers the online holder, falls back for what it lacks
  const auto routed = admin.ResolveDownload("alpha");
  assert(!routed.fallback());
  assert(routed.mirror_id() == paired.mirror_id());
  const auto fallback = admin.ResolveDownload("charlie");
  assert(fallback.fallback());
  assert(fallback.url() == "https://origin.example/download/charlie");

  std::string downloaded;
  const auto  bytes = mirror.Download("alpha", [&](std::string_view chunk) { downloaded.append(chunk); });
  assert(bytes == 200'000);
  assert(downloaded == std::string(200'000, 'a'));

  threw = false;
  try {
    mirror.Download("charlie", [](std::string_view) {});
  } catch (const mirrorsync::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // a new popular entry displaces the weakest holding
  Publish(origin, "delta", "delta bytes", 100);
  const auto notified = admin.NotifyCatalogChanged(kAdminToken);
  assert(notified.mirrors_queued() == 1);
  assert(WaitFor([&] { return Held(mirror, credential) == std::set<std::string>{"alpha", "delta"}; }));

  const auto log = admin.ListSyncLog(kAdminToken, paired.mirror_id(), 0);
  bool       saw_evict = false;
  for (const auto& e : log.entries()) {
    if (e.entry_id() == "bravo" && e.action() == SYNC_ACTION_EVICT) saw_evict = true;
  }
  assert(saw_evict);

  // wrong credential never reaches the store
  threw = false;
  try {
    mirror.ListFiles("not-the-credential");
  } catch (const mirrorsync::util::Unauthenticated&) {
    threw = true;
  }
  assert(threw);

  agent.Stop();
  agent_server.Stop();
  origin.Stop();
  origin_server.Stop();
}

} // namespace

int main() {
  TestPairApproveSyncServe();

  std::cout << "origin_mirror_roundtrip_test: pass\n";
  return 0;
}
