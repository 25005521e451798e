#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_content_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/secrets.hpp"

namespace {

using mirrorsync::storage::DiskContentStore;

struct TempRoot {
  std::filesystem::path path = std::filesystem::temp_directory_path() / ("disk_content_store_test_" + mirrorsync::util::RandomToken(4));
  ~TempRoot() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

std::string ReadAll(DiskContentStore& store, const std::string& key) {
  auto       file = store.Open(key);
  const auto size = mirrorsync::storage::common::Unwrap(file->GetSize());
  auto       buf  = mirrorsync::storage::common::Unwrap(file->ReadAt(0, size));
  return buf->ToString();
}

void TestCommitMakesContentVisible() {
  TempRoot         root;
  DiskContentStore store(root.path);

  auto writer = store.Stage("entry-1");
  writer->Append("hello ", 6);
  writer->Append("mirror", 6);
  assert(writer->BytesWritten() == 12);
  assert(!store.Exists("entry-1"));

  writer->Commit(true);
  assert(store.Exists("entry-1"));
  assert(store.Size("entry-1") == 12);
  assert(ReadAll(store, "entry-1") == "hello mirror");

  // restaging replaces atomically
  auto again = store.Stage("entry-1");
  again->Append("v2", 2);
  again->Commit(false);
  assert(ReadAll(store, "entry-1") == "v2");
}

void TestAbandonedWriterLeavesNothing() {
  TempRoot         root;
  DiskContentStore store(root.path);
  {
    auto writer = store.Stage("partial");
    writer->Append("abc", 3);
  }
  assert(!store.Exists("partial"));
  assert(std::filesystem::is_empty(root.path));
}

void TestSweepStagingRemovesCrashLeftovers() {
  TempRoot         root;
  DiskContentStore store(root.path);

  std::ofstream(root.path / ".entry-9.abcd.partial") << "junk";
  std::ofstream(root.path / "entry-9") << "kept";

  assert(store.SweepStaging() == 1);
  assert(store.Exists("entry-9"));
  assert(!std::filesystem::exists(root.path / ".entry-9.abcd.partial"));
}

void TestMissingAndInvalidKeys() {
  TempRoot         root;
  DiskContentStore store(root.path);

  bool threw = false;
  try {
    store.Open("nope");
  } catch (const mirrorsync::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    store.Size("nope");
  } catch (const mirrorsync::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  store.Remove("nope");

  for (const char* key : {"../escape", "a/b", ".hidden", ""}) {
    threw = false;
    try {
      store.Stage(key);
    } catch (const mirrorsync::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestCommitMakesContentVisible();
  TestAbandonedWriterLeavesNothing();
  TestSweepStagingRemovesCrashLeftovers();
  TestMissingAndInvalidKeys();

  std::cout << "disk_content_store_test: pass\n";
  return 0;
}
