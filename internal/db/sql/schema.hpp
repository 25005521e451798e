#pragma once

#include <array>

namespace mirrorsync::db::sql {

/*
  Canonical schema, applied with CREATE ... IF NOT EXISTS at startup.

  Timestamps are unix milliseconds. Enum columns store the protobuf enum
  number. mirror_files has no foreign key to mirrors: an agent keeps its own
  rows without a local registry.
*/

inline constexpr std::array<const char*, 8> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS mirrors ("
    " id TEXT PRIMARY KEY, name TEXT NOT NULL, status INTEGER NOT NULL, credential TEXT NOT NULL UNIQUE,"
    " direct_url TEXT NOT NULL, tunnel_url TEXT NOT NULL DEFAULT '', max_files INTEGER NOT NULL,"
    " last_heartbeat_ms INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL,"
    " last_sync_ms INTEGER NOT NULL DEFAULT 0, reported_files INTEGER NOT NULL DEFAULT 0);",

    "CREATE TABLE IF NOT EXISTS pairing_codes ("
    " code TEXT PRIMARY KEY, issued_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL,"
    " consumed INTEGER NOT NULL DEFAULT 0, mirror_id TEXT NOT NULL DEFAULT '');",

    "CREATE TABLE IF NOT EXISTS mirror_files ("
    " mirror_id TEXT NOT NULL, entry_id TEXT NOT NULL, state INTEGER NOT NULL, synced_at_ms INTEGER NOT NULL,"
    " size_bytes INTEGER NOT NULL DEFAULT 0, content_hash TEXT NOT NULL DEFAULT '', popularity INTEGER NOT NULL DEFAULT 0,"
    " created_at_ms INTEGER NOT NULL DEFAULT 0, download_count INTEGER NOT NULL DEFAULT 0,"
    " PRIMARY KEY (mirror_id, entry_id));",

    "CREATE INDEX IF NOT EXISTS mirror_files_by_entry ON mirror_files(entry_id);",

    "CREATE TABLE IF NOT EXISTS sync_log ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT, mirror_id TEXT NOT NULL, entry_id TEXT NOT NULL,"
    " action INTEGER NOT NULL, at_ms INTEGER NOT NULL, detail TEXT NOT NULL DEFAULT '');",

    "CREATE INDEX IF NOT EXISTS sync_log_by_mirror ON sync_log(mirror_id, seq);",

    "CREATE TABLE IF NOT EXISTS catalog_entries ("
    " id TEXT PRIMARY KEY, content_hash TEXT NOT NULL, size_bytes INTEGER NOT NULL, download_count INTEGER NOT NULL DEFAULT 0,"
    " created_at_ms INTEGER NOT NULL, approved INTEGER NOT NULL DEFAULT 0, filename TEXT NOT NULL DEFAULT '');",

    "CREATE TABLE IF NOT EXISTS node_settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
};

inline constexpr std::array<const char*, 8> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS mirrors ("
    " id TEXT PRIMARY KEY, name TEXT NOT NULL, status SMALLINT NOT NULL, credential TEXT NOT NULL UNIQUE,"
    " direct_url TEXT NOT NULL, tunnel_url TEXT NOT NULL DEFAULT '', max_files BIGINT NOT NULL,"
    " last_heartbeat_ms BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL,"
    " last_sync_ms BIGINT NOT NULL DEFAULT 0, reported_files BIGINT NOT NULL DEFAULT 0);",

    "CREATE TABLE IF NOT EXISTS pairing_codes ("
    " code TEXT PRIMARY KEY, issued_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL,"
    " consumed BOOLEAN NOT NULL DEFAULT FALSE, mirror_id TEXT NOT NULL DEFAULT '');",

    "CREATE TABLE IF NOT EXISTS mirror_files ("
    " mirror_id TEXT NOT NULL, entry_id TEXT NOT NULL, state SMALLINT NOT NULL, synced_at_ms BIGINT NOT NULL,"
    " size_bytes BIGINT NOT NULL DEFAULT 0, content_hash TEXT NOT NULL DEFAULT '', popularity BIGINT NOT NULL DEFAULT 0,"
    " created_at_ms BIGINT NOT NULL DEFAULT 0, download_count BIGINT NOT NULL DEFAULT 0,"
    " PRIMARY KEY (mirror_id, entry_id));",

    "CREATE INDEX IF NOT EXISTS mirror_files_by_entry ON mirror_files(entry_id);",

    "CREATE TABLE IF NOT EXISTS sync_log ("
    " seq BIGSERIAL PRIMARY KEY, mirror_id TEXT NOT NULL, entry_id TEXT NOT NULL,"
    " action SMALLINT NOT NULL, at_ms BIGINT NOT NULL, detail TEXT NOT NULL DEFAULT '');",

    "CREATE INDEX IF NOT EXISTS sync_log_by_mirror ON sync_log(mirror_id, seq);",

    "CREATE TABLE IF NOT EXISTS catalog_entries ("
    " id TEXT PRIMARY KEY, content_hash TEXT NOT NULL, size_bytes BIGINT NOT NULL, download_count BIGINT NOT NULL DEFAULT 0,"
    " created_at_ms BIGINT NOT NULL, approved BOOLEAN NOT NULL DEFAULT FALSE, filename TEXT NOT NULL DEFAULT '');",

    "CREATE TABLE IF NOT EXISTS node_settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
};

} // namespace mirrorsync::db::sql
