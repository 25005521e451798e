#pragma once

#include <cstdint>
#include <string>

namespace mirrorsync::db::model {

/*
  Catalog row, owned by the upload/approval subsystem.

  The sync core reads it and never writes it; UpsertCatalogEntry exists for
  that subsystem and for seeding.
*/

struct CatalogEntryRecord {
  std::string id;
  std::string content_hash;
  uint64_t    size_bytes     = 0;
  uint64_t    download_count = 0;
  uint64_t    created_at_ms  = 0;
  bool        approved       = false;
  std::string filename;
};

} // namespace mirrorsync::db::model
