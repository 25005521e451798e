#pragma once

#include <cstdint>

#include "internal/db/model/catalog_entry_record.hpp"
#include "internal/db/model/mirror_file_record.hpp"
#include "internal/db/model/mirror_record.hpp"
#include "internal/db/model/sync_log_record.hpp"
#include "mirrorsync/v1/types.pb.h"

namespace mirrorsync::model {

// Never copies the credential.
mirrorsync::v1::Mirror ToProto(const db::model::MirrorRecord& record, uint64_t held_files);

mirrorsync::v1::CatalogEntry ToProto(const db::model::CatalogEntryRecord& record);
db::model::CatalogEntryRecord FromProto(const mirrorsync::v1::CatalogEntry& entry);

mirrorsync::v1::MirrorFile   ToProto(const db::model::MirrorFileRecord& record);
mirrorsync::v1::SyncLogEntry ToProto(const db::model::SyncLogRecord& record);

// The agent ranks its holdings with the popularity snapshot it stored.
db::model::CatalogEntryRecord AsCatalogEntry(const db::model::MirrorFileRecord& record);

} // namespace mirrorsync::model
