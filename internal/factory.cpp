#include "factory.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "client/cpp/mirror_client.h"
#include "client/cpp/origin_client.h"
#include "internal/agent/heartbeat_sender.hpp"
#include "internal/agent/mirror_agent.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/mirror_server.hpp"
#include "internal/grpc/origin_server.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/heartbeat/heartbeat_sweeper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pairing/pairing_service.hpp"
#include "internal/registry/mirror_registry.hpp"
#include "internal/routing/download_router.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/mirror_service.hpp"
#include "internal/service/origin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/disk/disk_content_store.hpp"
#include "internal/sync/sync_orchestrator.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/sync/sync_ticker.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/periodic_task.hpp"
#include "internal/util/time.hpp"
#if MIRRORSYNC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if MIRRORSYNC_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace mirrorsync::factory {

using namespace std::chrono_literals;
using mirrorsync::observability::StringField;
using mirrorsync::runtime::config::RuntimeConfig;

namespace {

constexpr std::chrono::milliseconds kDefaultHeartbeatInterval = 60s;
constexpr std::chrono::milliseconds kDefaultSyncInterval      = 300s;
constexpr std::chrono::milliseconds kDefaultSyncRpcTimeout    = 600s;
constexpr std::chrono::milliseconds kDefaultAgentRpcTimeout   = 10s;
constexpr std::chrono::milliseconds kDefaultFetchTimeout      = 600s;
constexpr uint32_t                  kDefaultSyncWorkers       = 4;

#if MIRRORSYNC_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const char* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,status,credential,max_files FROM mirrors LIMIT 1;");
  sqlite_db->Exec("SELECT mirror_id,entry_id,state FROM mirror_files LIMIT 1;");
  sqlite_db->Exec("SELECT seq,mirror_id,action FROM sync_log LIMIT 1;");
}
#endif

#if MIRRORSYNC_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const char* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,status,credential,max_files FROM mirrors LIMIT 1;");
  tx.exec("SELECT mirror_id,entry_id,state FROM mirror_files LIMIT 1;");
  tx.exec("SELECT seq,mirror_id,action FROM sync_log LIMIT 1;");
  tx.commit();
}
#endif

std::string HashAlgorithmOr(const std::string& configured) {
  return configured.empty() ? "md5" : configured;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MIRRORSYNC_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if MIRRORSYNC_DB_POSTGRES
    const auto pool_size = database.postgres().pool_size() == 0 ? 16u : database.postgres().pool_size();
    auto       pool      = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), pool_size);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigError("postgres backend requested but not enabled at build time; rebuild with MIRRORSYNC_DB_POSTGRES=ON");
#endif
  }

  MIRRORSYNC_LOG_WARN("no database configured; state is kept in memory and lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

// ---------------------------------------------------------------------
// Origin
// ---------------------------------------------------------------------

OriginApplication BuildOrigin(const RuntimeConfig& config, std::shared_ptr<sync::MirrorTransport> transport) {
  const auto& origin = config.origin();

  OriginApplication app;
  app.repository = BuildRepository(config);
  app.archive    = std::make_shared<storage::DiskContentStore>(origin.archive_path());

  pairing::PairingOptions pairing_options;
  pairing_options.code_ttl = util::DurationOr(origin.pairing().code_ttl(), pairing_options.code_ttl);
  if (origin.pairing().max_outstanding_codes() > 0) pairing_options.max_outstanding_codes = origin.pairing().max_outstanding_codes();
  if (origin.pairing().code_length() > 0) pairing_options.code_length = origin.pairing().code_length();

  heartbeat::HeartbeatOptions heartbeat_options;
  heartbeat_options.interval = util::DurationOr(origin.heartbeat().interval(), kDefaultHeartbeatInterval);
  if (origin.heartbeat().timeout_multiplier() > 0) heartbeat_options.timeout_multiplier = origin.heartbeat().timeout_multiplier();
  heartbeat_options.timeout = util::DurationOr(origin.heartbeat().timeout(), 0ms);

  const auto sync_interval = util::DurationOr(origin.sync().interval(), kDefaultSyncInterval);
  const auto rpc_timeout   = util::DurationOr(origin.sync().rpc_timeout(), kDefaultSyncRpcTimeout);
  const auto workers       = origin.sync().workers() > 0 ? origin.sync().workers() : kDefaultSyncWorkers;

  if (!transport) {
    transport = std::make_shared<client::MirrorTransportClient>(rpc_timeout);
  }

  app.registry     = std::make_shared<registry::MirrorRegistry>(app.repository);
  app.pairing      = std::make_shared<pairing::PairingService>(app.repository, pairing_options);
  app.heartbeat    = std::make_shared<heartbeat::HeartbeatMonitor>(app.repository, heartbeat_options);
  app.sweeper      = std::make_shared<heartbeat::HeartbeatSweeper>(app.heartbeat, app.pairing, app.registry,
                                                                   std::min(heartbeat_options.interval, heartbeat_options.EffectiveTimeout()));
  app.orchestrator = std::make_shared<sync::SyncOrchestrator>(app.repository, std::move(transport));
  app.scheduler    = std::make_shared<sync::SyncScheduler>();
  app.workers      = std::make_shared<sync::SyncWorker>(app.scheduler, app.orchestrator, workers);
  app.ticker       = std::make_shared<sync::SyncTicker>(app.repository, app.scheduler, sync_interval);
  app.router       = std::make_shared<routing::DownloadRouter>(app.repository, origin.public_url());

  service::ServiceContext ctx;
  ctx.repository             = app.repository;
  ctx.registry               = app.registry;
  ctx.pairing                = app.pairing;
  ctx.heartbeat              = app.heartbeat;
  ctx.scheduler              = app.scheduler;
  ctx.ticker                 = app.ticker;
  ctx.router                 = app.router;
  ctx.archive                = app.archive;
  ctx.admin_token            = origin.admin_token();
  ctx.sync_on_catalog_change = origin.sync().sync_on_catalog_change();

  app.grpc_services.push_back(std::make_shared<grpc::OriginServer>(std::make_shared<service::OriginService>(ctx)));
  app.grpc_services.push_back(std::make_shared<grpc::AdminServer>(std::make_shared<service::AdminService>(ctx)));
  return app;
}

void OriginApplication::Start() {
  workers->Start();
  sweeper->Start();
  ticker->Start();
}

void OriginApplication::Stop() {
  ticker->Stop();
  sweeper->Stop();
  scheduler->Shutdown();
  workers->Stop();
}

// ---------------------------------------------------------------------
// Agent
// ---------------------------------------------------------------------

AgentApplication BuildAgent(const RuntimeConfig& config, std::shared_ptr<agent::OriginLink> origin) {
  const auto& cfg = config.agent();

  AgentApplication app;
  app.repository = BuildRepository(config);

  auto store = std::make_shared<storage::DiskContentStore>(cfg.storage_path());
  if (const auto swept = store->SweepStaging(); swept > 0) {
    MIRRORSYNC_LOG_INFO("removed partial downloads from a previous run", {observability::UintField("count", swept)});
  }
  app.store = store;

  if (!origin) {
    origin = std::make_shared<client::OriginClient>(::grpc::CreateChannel(cfg.origin_url(), ::grpc::InsecureChannelCredentials()),
                                                    util::DurationOr(cfg.rpc_timeout(), kDefaultAgentRpcTimeout),
                                                    util::DurationOr(cfg.fetch_timeout(), kDefaultFetchTimeout));
  }
  app.origin = origin;

  agent::AgentOptions options;
  options.mirror_name            = cfg.mirror_name();
  options.max_files              = cfg.max_files();
  options.direct_url             = cfg.direct_url();
  options.tunnel_url             = cfg.tunnel_url();
  options.content_hash_algorithm = HashAlgorithmOr(cfg.content_hash_algorithm());
  options.download_speed_limit   = cfg.download_speed_limit();

  app.agent     = std::make_shared<agent::MirrorAgent>(app.repository, app.store, origin, options);
  app.heartbeat = std::make_shared<agent::HeartbeatSender>(app.agent, origin, util::DurationOr(cfg.heartbeat_interval(), kDefaultHeartbeatInterval));

  auto mirror_agent = app.agent;
  app.maintenance   = std::make_shared<util::PeriodicTask>("maintenance", util::DurationOr(cfg.sync_interval(), kDefaultSyncInterval),
                                                         [mirror_agent] { mirror_agent->Maintain(); });

  app.bind_address = config.server().bind_address().empty() ? "0.0.0.0:" + std::to_string(cfg.listen_port()) : config.server().bind_address();
  app.pairing_code = cfg.pairing_code();

  app.grpc_services.push_back(std::make_shared<grpc::MirrorServer>(std::make_shared<service::MirrorService>(app.agent)));
  return app;
}

void AgentApplication::Start() {
  if (!pairing_code.empty() && !agent->Paired()) {
    try {
      agent->Pair(pairing_code, "", "");
    } catch (const std::exception& e) {
      MIRRORSYNC_LOG_ERROR("pairing at startup failed; pair through the Pair endpoint once the origin accepts a code",
                           {StringField("error", e.what())});
    }
  }

  heartbeat->Start();
  maintenance->Start();
}

void AgentApplication::Stop() {
  maintenance->Stop();
  heartbeat->Stop();
}

} // namespace mirrorsync::factory
