#include "internal/policy/priority_policy.hpp"

#include <algorithm>

namespace mirrorsync::policy {

bool RanksBefore(const CatalogEntryRecord& a, const CatalogEntryRecord& b) {
  if (a.download_count != b.download_count) return a.download_count > b.download_count;
  if (a.size_bytes != b.size_bytes) return a.size_bytes < b.size_bytes;
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
  return a.id < b.id;
}

std::vector<CatalogEntryRecord> Rank(std::vector<CatalogEntryRecord> entries) {
  std::sort(entries.begin(), entries.end(), RanksBefore);
  return entries;
}

std::vector<CatalogEntryRecord> Select(std::vector<CatalogEntryRecord> entries, size_t n) {
  if (n < entries.size()) {
    std::partial_sort(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(n), entries.end(), RanksBefore);
    entries.resize(n);
    return entries;
  }
  return Rank(std::move(entries));
}

std::vector<CatalogEntryRecord> Lowest(std::vector<CatalogEntryRecord> entries, size_t k) {
  auto ranked = Rank(std::move(entries));
  k           = std::min(k, ranked.size());

  std::vector<CatalogEntryRecord> out(ranked.rbegin(), ranked.rbegin() + static_cast<std::ptrdiff_t>(k));
  return out;
}

} // namespace mirrorsync::policy
