#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "internal/policy/priority_policy.hpp"

namespace {

using mirrorsync::db::model::CatalogEntryRecord;

CatalogEntryRecord Entry(const std::string& id, uint64_t downloads, uint64_t size = 100, uint64_t created_at = 1000) {
  CatalogEntryRecord e;
  e.id             = id;
  e.download_count = downloads;
  e.size_bytes     = size;
  e.created_at_ms  = created_at;
  e.approved       = true;
  return e;
}

std::vector<std::string> Ids(const std::vector<CatalogEntryRecord>& entries) {
  std::vector<std::string> ids;
  for (const auto& e : entries) ids.push_back(e.id);
  return ids;
}

void TestSelectKeepsTopByPopularity() {
  const std::vector<CatalogEntryRecord> entries = {Entry("a", 50), Entry("b", 10), Entry("c", 5), Entry("d", 1)};

  const auto selected = mirrorsync::policy::Select(entries, 3);
  assert((Ids(selected) == std::vector<std::string>{"a", "b", "c"}));

  const auto lowest = mirrorsync::policy::Lowest(entries, 1);
  assert((Ids(lowest) == std::vector<std::string>{"d"}));
}

void TestTieBreaksSizeThenNewestThenId() {
  // equal downloads: smaller first
  assert(mirrorsync::policy::RanksBefore(Entry("big", 7, 900), Entry("small", 7, 100)) == false);
  assert(mirrorsync::policy::RanksBefore(Entry("small", 7, 100), Entry("big", 7, 900)));

  // equal downloads and size: newer first
  assert(mirrorsync::policy::RanksBefore(Entry("new", 7, 100, 2000), Entry("old", 7, 100, 1000)));

  // fully tied: id ascending
  assert(mirrorsync::policy::RanksBefore(Entry("x1", 7, 100, 1000), Entry("x2", 7, 100, 1000)));
  assert(!mirrorsync::policy::RanksBefore(Entry("x2", 7, 100, 1000), Entry("x2", 7, 100, 1000)));
}

void TestOrderIgnoresInputOrder() {
  std::vector<CatalogEntryRecord> entries;
  for (int i = 0; i < 40; ++i) {
    entries.push_back(Entry("e" + std::to_string(i), static_cast<uint64_t>(i % 5), static_cast<uint64_t>(100 + i % 3), static_cast<uint64_t>(i % 4)));
  }

  const auto expected = Ids(mirrorsync::policy::Rank(entries));

  std::mt19937 rng(42);
  for (int round = 0; round < 10; ++round) {
    std::shuffle(entries.begin(), entries.end(), rng);
    assert(Ids(mirrorsync::policy::Rank(entries)) == expected);
    assert(Ids(mirrorsync::policy::Select(entries, 7)) == std::vector<std::string>(expected.begin(), expected.begin() + 7));
  }
}

void TestLowestIsWorstFirstAndClamped() {
  const std::vector<CatalogEntryRecord> entries = {Entry("a", 3), Entry("b", 2), Entry("c", 1)};

  assert((Ids(mirrorsync::policy::Lowest(entries, 2)) == std::vector<std::string>{"c", "b"}));
  assert(mirrorsync::policy::Lowest(entries, 10).size() == 3);
  assert(mirrorsync::policy::Select(entries, 10).size() == 3);
  assert(mirrorsync::policy::Select({}, 3).empty());
}

} // namespace

int main() {
  TestSelectKeepsTopByPopularity();
  TestTieBreaksSizeThenNewestThenId();
  TestOrderIgnoresInputOrder();
  TestLowestIsWorstFirstAndClamped();

  std::cout << "priority_policy_test: pass\n";
  return 0;
}
