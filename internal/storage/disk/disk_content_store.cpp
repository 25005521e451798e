#include "disk_content_store.hpp"

#include <arrow/io/file.h>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/secrets.hpp"

namespace mirrorsync::storage {

using namespace mirrorsync::storage::common;

namespace {

class DiskContentWriter final : public ContentWriter {
 public:
  DiskContentWriter(std::filesystem::path final_path, std::filesystem::path tmp_path)
      : final_path_(std::move(final_path)), tmp_path_(std::move(tmp_path)) {
    out_ = Unwrap(arrow::io::FileOutputStream::Open(tmp_path_.string()));
  }

  ~DiskContentWriter() override {
    if (committed_) return;
    if (out_ && !out_->closed()) {
      const auto status = out_->Close();
      if (!status.ok()) {
        MIRRORSYNC_LOG_WARN("close staged content failed", {observability::StringField("path", tmp_path_.string()),
                                                             observability::StringField("error", status.ToString())});
      }
    }
    std::error_code ec;
    std::filesystem::remove(tmp_path_, ec);
  }

  void Append(const void* data, size_t size) override {
    Unwrap(out_->Write(data, static_cast<int64_t>(size)));
    written_ += size;
  }

  uint64_t BytesWritten() const override {
    return written_;
  }

  /*
    Atomic write:
        write tmp -> flush -> rename
  */
  void Commit(bool fsync) override {
    if (fsync) Unwrap(out_->Flush());
    Unwrap(out_->Close());

    std::filesystem::rename(tmp_path_, final_path_);
    committed_ = true;
  }

 private:
  std::filesystem::path                     final_path_;
  std::filesystem::path                     tmp_path_;
  std::shared_ptr<arrow::io::FileOutputStream> out_;
  uint64_t                                  written_   = 0;
  bool                                      committed_ = false;
};

} // namespace

DiskContentStore::DiskContentStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::unique_ptr<ContentWriter> DiskContentStore::Stage(const std::string& key) {
  auto final_path = ContentPath(root_, key);
  auto tmp_path   = StagingPath(root_, key, util::RandomToken(6));
  return std::make_unique<DiskContentWriter>(std::move(final_path), std::move(tmp_path));
}

std::shared_ptr<arrow::io::RandomAccessFile> DiskContentStore::Open(const std::string& key) {
  auto path = ContentPath(root_, key);
  if (!std::filesystem::is_regular_file(path)) throw util::NotFound("content not found: " + key);

  return Unwrap(arrow::io::ReadableFile::Open(path.string()));
}

bool DiskContentStore::Exists(const std::string& key) {
  std::error_code ec;
  return std::filesystem::is_regular_file(ContentPath(root_, key), ec);
}

uint64_t DiskContentStore::Size(const std::string& key) {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(ContentPath(root_, key), ec);
  if (ec) throw util::NotFound("content not found: " + key);
  return static_cast<uint64_t>(size);
}

void DiskContentStore::Remove(const std::string& key) {
  std::filesystem::remove(ContentPath(root_, key));
}

size_t DiskContentStore::SweepStaging() {
  size_t removed = 0;
  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    const auto name = entry.path().filename().string();
    if (entry.is_regular_file() && !name.empty() && name.front() == '.' && name.ends_with(".partial")) {
      std::error_code ec;
      if (std::filesystem::remove(entry.path(), ec)) ++removed;
    }
  }
  return removed;
}

} // namespace mirrorsync::storage
