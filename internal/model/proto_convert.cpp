#include "internal/model/proto_convert.hpp"

#include "internal/util/time.hpp"

namespace mirrorsync::model {

mirrorsync::v1::Mirror ToProto(const db::model::MirrorRecord& record, uint64_t held_files) {
  mirrorsync::v1::Mirror m;
  m.set_id(record.id);
  m.set_name(record.name);
  m.set_status(record.status);
  m.set_direct_url(record.direct_url);
  m.set_tunnel_url(record.tunnel_url);
  m.set_max_files(record.max_files);
  if (record.last_heartbeat_ms != 0) {
    *m.mutable_last_heartbeat() = util::MillisToProto(record.last_heartbeat_ms);
  }
  *m.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  if (record.last_sync_ms != 0) {
    *m.mutable_last_sync() = util::MillisToProto(record.last_sync_ms);
  }
  m.set_reported_files(record.reported_files);
  m.set_held_files(held_files);
  return m;
}

mirrorsync::v1::CatalogEntry ToProto(const db::model::CatalogEntryRecord& record) {
  mirrorsync::v1::CatalogEntry e;
  e.set_id(record.id);
  e.set_content_hash(record.content_hash);
  e.set_size_bytes(record.size_bytes);
  e.set_download_count(record.download_count);
  *e.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  e.set_filename(record.filename);
  return e;
}

db::model::CatalogEntryRecord FromProto(const mirrorsync::v1::CatalogEntry& entry) {
  db::model::CatalogEntryRecord r;
  r.id             = entry.id();
  r.content_hash   = entry.content_hash();
  r.size_bytes     = entry.size_bytes();
  r.download_count = entry.download_count();
  r.created_at_ms  = util::ToUnixMillis(util::FromProto(entry.created_at()));
  r.approved       = true;
  r.filename       = entry.filename();
  return r;
}

mirrorsync::v1::MirrorFile ToProto(const db::model::MirrorFileRecord& record) {
  mirrorsync::v1::MirrorFile f;
  f.set_mirror_id(record.mirror_id);
  f.set_entry_id(record.entry_id);
  f.set_state(record.state);
  *f.mutable_synced_at() = util::MillisToProto(record.synced_at_ms);
  f.set_size_bytes(record.size_bytes);
  f.set_content_hash(record.content_hash);
  f.set_download_count(record.download_count);
  return f;
}

mirrorsync::v1::SyncLogEntry ToProto(const db::model::SyncLogRecord& record) {
  mirrorsync::v1::SyncLogEntry e;
  e.set_seq(record.seq);
  e.set_mirror_id(record.mirror_id);
  e.set_entry_id(record.entry_id);
  e.set_action(record.action);
  *e.mutable_at() = util::MillisToProto(record.at_ms);
  e.set_detail(record.detail);
  return e;
}

db::model::CatalogEntryRecord AsCatalogEntry(const db::model::MirrorFileRecord& record) {
  db::model::CatalogEntryRecord r;
  r.id             = record.entry_id;
  r.content_hash   = record.content_hash;
  r.size_bytes     = record.size_bytes;
  r.download_count = record.popularity;
  r.created_at_ms  = record.created_at_ms;
  r.approved       = true;
  return r;
}

} // namespace mirrorsync::model
