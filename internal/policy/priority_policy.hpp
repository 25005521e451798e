#pragma once

#include <cstddef>
#include <vector>

#include "internal/db/model/catalog_entry_record.hpp"

namespace mirrorsync::policy {

using db::model::CatalogEntryRecord;

/*
  Ranks catalog entries by distribution/retention desirability.

    1. download_count descending
    2. size_bytes ascending (more items fit a fixed budget)
    3. created_at descending (newer first)
    4. id ascending

  The order is total, so the origin and a mirror ranking the same entries
  always agree. Pure functions; input order never matters.
*/

bool RanksBefore(const CatalogEntryRecord& a, const CatalogEntryRecord& b);

std::vector<CatalogEntryRecord> Rank(std::vector<CatalogEntryRecord> entries);

// Top n in rank order.
std::vector<CatalogEntryRecord> Select(std::vector<CatalogEntryRecord> entries, size_t n);

// Bottom k, worst first.
std::vector<CatalogEntryRecord> Lowest(std::vector<CatalogEntryRecord> entries, size_t k);

} // namespace mirrorsync::policy
