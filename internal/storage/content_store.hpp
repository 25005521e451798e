#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace mirrorsync::storage {

/*
  Staged write of one content file.

  Bytes go to a hidden temporary file; Commit() renames it into place.
  Destroying an uncommitted writer removes the temporary file, so an
  interrupted transfer never leaves partial content behind.
*/
class ContentWriter {
 public:
  virtual ~ContentWriter() = default;

  virtual void Append(const void* data, size_t size) = 0;

  virtual uint64_t BytesWritten() const = 0;

  virtual void Commit(bool fsync) = 0;
};

/*
  Flat key -> bytes store.

  The origin keeps its archive in one (keyed by filename), each mirror
  agent keeps its replicas in another (keyed by entry id).
*/
class ContentStore {
 public:
  virtual ~ContentStore() = default;

  virtual std::unique_ptr<ContentWriter> Stage(const std::string& key) = 0;

  // Throws NotFound.
  virtual std::shared_ptr<arrow::io::RandomAccessFile> Open(const std::string& key) = 0;

  virtual bool Exists(const std::string& key) = 0;

  // Throws NotFound.
  virtual uint64_t Size(const std::string& key) = 0;

  // Missing keys are ignored.
  virtual void Remove(const std::string& key) = 0;
};

using ContentStorePtr = std::shared_ptr<ContentStore>;

} // namespace mirrorsync::storage
