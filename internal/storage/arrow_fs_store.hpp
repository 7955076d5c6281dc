#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>

#include "internal/storage/storage_backend.hpp"

namespace batchsync::storage {

/*
  StorageBackend over an Arrow filesystem.

  Properties:
    - rename is atomic on local filesystems (POSIX rename)
    - modification times come straight from the filesystem, so
      network drives report their own (possibly coarse) granularity
*/

class ArrowFsStore final : public StorageBackend {
 public:
  explicit ArrowFsStore(std::shared_ptr<arrow::fs::FileSystem> fs);

  bool IsAccessible(const std::string& root) override;
  bool DirectoryExists(const std::string& path) override;
  std::vector<std::string> ListDirectories(const std::string& path) override;
  std::optional<uint64_t> FileSize(const std::string& path) override;

  model::Manifest Enumerate(const std::string& dir) override;

  std::shared_ptr<arrow::io::InputStream> OpenRead(const std::string& path) override;
  std::shared_ptr<arrow::io::OutputStream> OpenWrite(const std::string& path) override;

  void CreateDirectory(const std::string& path) override;
  void Rename(const std::string& from, const std::string& to) override;
  void Remove(const std::string& path) override;

  const std::shared_ptr<arrow::fs::FileSystem>& filesystem() const {
    return fs_;
  }

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
};

} // namespace batchsync::storage
