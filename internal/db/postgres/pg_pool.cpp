#include "pg_pool.hpp"

namespace mirrorsync::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_mirror",
               "SELECT id,name,status,credential,direct_url,tunnel_url,max_files,last_heartbeat_ms,created_at_ms,last_sync_ms,reported_files "
               "FROM mirrors WHERE id=$1");

  conn.prepare("find_mirror_by_credential",
               "SELECT id,name,status,credential,direct_url,tunnel_url,max_files,last_heartbeat_ms,created_at_ms,last_sync_ms,reported_files "
               "FROM mirrors WHERE credential=$1");

  conn.prepare("insert_mirror",
               "INSERT INTO mirrors(id,name,status,credential,direct_url,tunnel_url,max_files,last_heartbeat_ms,created_at_ms,last_sync_ms,reported_files) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

  conn.prepare("update_mirror",
               "UPDATE mirrors SET name=$2,status=$3,direct_url=$4,tunnel_url=$5,max_files=$6,last_heartbeat_ms=$7,last_sync_ms=$8,reported_files=$9 "
               "WHERE id=$1");

  // Row lock serializes concurrent redemptions of the same code.
  conn.prepare("get_pairing_code_for_update",
               "SELECT code,issued_at_ms,expires_at_ms,consumed,mirror_id FROM pairing_codes WHERE code=$1 FOR UPDATE");

  conn.prepare("upsert_mirror_file",
               "INSERT INTO mirror_files(mirror_id,entry_id,state,synced_at_ms,size_bytes,content_hash,popularity,created_at_ms,download_count) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) "
               "ON CONFLICT(mirror_id,entry_id) DO UPDATE SET state=EXCLUDED.state,synced_at_ms=EXCLUDED.synced_at_ms,"
               "size_bytes=EXCLUDED.size_bytes,content_hash=EXCLUDED.content_hash,popularity=EXCLUDED.popularity,"
               "created_at_ms=EXCLUDED.created_at_ms,download_count=EXCLUDED.download_count");

  conn.prepare("append_sync_log",
               "INSERT INTO sync_log(mirror_id,entry_id,action,at_ms,detail) VALUES($1,$2,$3,$4,$5) RETURNING seq");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace mirrorsync::db::postgres
