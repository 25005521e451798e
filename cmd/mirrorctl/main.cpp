#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "client/cpp/mirror_client.h"
#include "client/cpp/origin_client.h"
#include "internal/model/mirror_status.hpp"
#include "internal/util/time.hpp"
#include "mirrorsync/v1.hpp"

using namespace mirrorsync::v1;
using mirrorsync::client::MirrorClient;
using mirrorsync::client::OriginClient;

static void Usage() {
  std::cout << "Usage (origin, token from MIRRORSYNC_TOKEN):\n"
            << "  mirrorctl <origin_addr> issue-code\n"
            << "  mirrorctl <origin_addr> approve <mirror_id>\n"
            << "  mirrorctl <origin_addr> reject <mirror_id>\n"
            << "  mirrorctl <origin_addr> list\n"
            << "  mirrorctl <origin_addr> log [mirror_id] [limit]\n"
            << "  mirrorctl <origin_addr> status <mirror_id>\n"
            << "  mirrorctl <origin_addr> trigger-sync <mirror_id>\n"
            << "  mirrorctl <origin_addr> catalog-changed\n"
            << "  mirrorctl <origin_addr> resolve <entry_id>\n"
            << "Usage (mirror node):\n"
            << "  mirrorctl <mirror_addr> health\n"
            << "  mirrorctl <mirror_addr> pair <code> [direct_url] [tunnel_url]\n"
            << "  mirrorctl <mirror_addr> files\n"
            << "  mirrorctl <mirror_addr> mirror-log [limit]\n"
            << "  mirrorctl <mirror_addr> download <entry_id> <out_path>\n";
}

static std::string Token() {
  const char* token = std::getenv("MIRRORSYNC_TOKEN");
  return token ? token : "";
}

static void PrintMirror(const Mirror& m) {
  std::cout << m.id() << "  " << m.name() << "  " << mirrorsync::model::StatusName(m.status()) << "  files=" << m.held_files() << "/"
            << m.max_files() << "  reported=" << m.reported_files() << "  url=" << (m.tunnel_url().empty() ? m.direct_url() : m.tunnel_url())
            << "\n";
}

static void PrintLog(const SyncLogEntry& e) {
  std::cout << e.seq() << "  " << mirrorsync::util::ToUnixMillis(mirrorsync::util::FromProto(e.at())) << "  " << e.mirror_id() << "  "
            << mirrorsync::model::ActionName(e.action()) << "  " << e.entry_id();
  if (!e.detail().empty()) std::cout << "  (" << e.detail() << ")";
  std::cout << "\n";
}

static int RunOrigin(OriginClient& origin, const std::string& cmd, int argc, char** argv) {
  const auto token = Token();

  if (cmd == "issue-code") {
    const auto resp = origin.IssuePairingCode(token);
    std::cout << resp.code() << "  expires_at_ms=" << mirrorsync::util::ToUnixMillis(mirrorsync::util::FromProto(resp.expires_at())) << "\n";
    return 0;
  }
  if (cmd == "approve" && argc >= 4) {
    PrintMirror(origin.ApproveMirror(token, argv[3]).mirror());
    return 0;
  }
  if (cmd == "reject" && argc >= 4) {
    PrintMirror(origin.RejectMirror(token, argv[3]).mirror());
    return 0;
  }
  if (cmd == "list") {
    for (const auto& m : origin.ListMirrors(token).mirrors()) PrintMirror(m);
    return 0;
  }
  if (cmd == "log") {
    const std::string mirror_id = argc >= 4 ? argv[3] : "";
    const uint32_t    limit     = argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 50;
    for (const auto& e : origin.ListSyncLog(token, mirror_id, limit).entries()) PrintLog(e);
    return 0;
  }
  if (cmd == "status" && argc >= 4) {
    const auto resp = origin.GetMirrorStatus(token, argv[3]);
    PrintMirror(resp.mirror());
    for (const auto& e : resp.recent_log()) PrintLog(e);
    return 0;
  }
  if (cmd == "trigger-sync" && argc >= 4) {
    const auto resp = origin.TriggerSync(token, argv[3]);
    std::cout << (resp.already_pending() ? "already pending" : "queued") << "\n";
    return 0;
  }
  if (cmd == "catalog-changed") {
    std::cout << "mirrors queued: " << origin.NotifyCatalogChanged(token).mirrors_queued() << "\n";
    return 0;
  }
  if (cmd == "resolve" && argc >= 4) {
    const auto resp = origin.ResolveDownload(argv[3]);
    std::cout << resp.url() << (resp.fallback() ? "  (origin fallback)" : "  mirror=" + resp.mirror_id()) << "\n";
    return 0;
  }
  return -1;
}

static int RunMirror(MirrorClient& mirror, const std::string& cmd, int argc, char** argv) {
  if (cmd == "health") {
    const auto resp = mirror.Health();
    const auto& c   = resp.counters();
    std::cout << "healthy=" << resp.healthy() << " paired=" << resp.paired() << " mirror_id=" << resp.mirror_id() << " name=" << resp.name()
              << " files=" << c.file_count() << "/" << c.max_files() << " bytes=" << c.total_bytes() << " active=" << c.active_downloads()
              << " served=" << c.downloads_served() << "\n";
    return 0;
  }
  if (cmd == "pair" && argc >= 4) {
    const auto resp = mirror.Pair(argv[3], argc >= 5 ? argv[4] : "", argc >= 6 ? argv[5] : "");
    std::cout << "mirror_id=" << resp.mirror_id() << "\ncredential=" << resp.credential() << "\n";
    return 0;
  }
  if (cmd == "files") {
    for (const auto& f : mirror.ListFiles(Token()).files()) {
      std::cout << f.entry_id() << "  " << f.size_bytes() << "  " << f.content_hash() << "  served=" << f.download_count() << "\n";
    }
    return 0;
  }
  if (cmd == "mirror-log") {
    const uint32_t limit = argc >= 4 ? static_cast<uint32_t>(std::stoul(argv[3])) : 50;
    for (const auto& e : mirror.ListLog(Token(), limit).entries()) PrintLog(e);
    return 0;
  }
  if (cmd == "download" && argc >= 5) {
    std::ofstream out(argv[4], std::ios::binary | std::ios::trunc);
    if (!out) {
      std::cerr << "cannot open " << argv[4] << " for writing\n";
      return 1;
    }
    const auto bytes = mirror.Download(argv[3], [&](std::string_view chunk) { out.write(chunk.data(), static_cast<std::streamsize>(chunk.size())); });
    std::cout << bytes << " bytes written to " << argv[4] << "\n";
    return 0;
  }
  return -1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  try {
    OriginClient origin(channel, std::chrono::seconds(30), std::chrono::seconds(30));
    int          rc = RunOrigin(origin, cmd, argc, argv);
    if (rc < 0) {
      MirrorClient mirror(channel, std::chrono::seconds(30));
      rc = RunMirror(mirror, cmd, argc, argv);
    }
    if (rc < 0) {
      Usage();
      return 1;
    }
    return rc;
  } catch (const std::exception& e) {
    std::cerr << cmd << ": " << e.what() << "\n";
    return 1;
  }
}
