#pragma once

#include <filesystem>

#include "internal/storage/content_store.hpp"

namespace mirrorsync::storage {

/*
  Local-disk content store using Arrow IO.

  Properties:
    - atomic replace writes (tmp -> rename)
    - optional fsync
    - random-access reads for chunked streaming
*/

class DiskContentStore final : public ContentStore {
public:
  explicit DiskContentStore(std::filesystem::path root);

  std::unique_ptr<ContentWriter> Stage(const std::string& key) override;

  std::shared_ptr<arrow::io::RandomAccessFile> Open(const std::string& key) override;

  bool Exists(const std::string& key) override;

  uint64_t Size(const std::string& key) override;

  void Remove(const std::string& key) override;

  // Deletes staging files left by a crash. Run once at startup.
  size_t SweepStaging();

  const std::filesystem::path& Root() const { return root_; }

private:
  std::filesystem::path root_;
};

}
