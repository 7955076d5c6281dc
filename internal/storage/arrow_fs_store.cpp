#include "arrow_fs_store.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace batchsync::storage {

using namespace batchsync::storage::common;

std::string StorageLocation::PathOf(const std::string& name) const {
  return JoinPath(root, name);
}

ArrowFsStore::ArrowFsStore(std::shared_ptr<arrow::fs::FileSystem> fs) : fs_(std::move(fs)) {
}

bool ArrowFsStore::IsAccessible(const std::string& root) {
  auto info = fs_->GetFileInfo(root);
  return info.ok() && info->type() == arrow::fs::FileType::Directory;
}

bool ArrowFsStore::DirectoryExists(const std::string& path) {
  auto info = Unwrap(fs_->GetFileInfo(path));
  return info.type() == arrow::fs::FileType::Directory;
}

std::vector<std::string> ArrowFsStore::ListDirectories(const std::string& path) {
  arrow::fs::FileSelector selector;
  selector.base_dir  = path;
  selector.recursive = false;

  std::vector<std::string> names;
  for (const auto& info : Unwrap(fs_->GetFileInfo(selector))) {
    if (info.type() == arrow::fs::FileType::Directory) {
      names.push_back(info.base_name());
    }
  }
  return names;
}

std::optional<uint64_t> ArrowFsStore::FileSize(const std::string& path) {
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) return std::nullopt;
  return static_cast<uint64_t>(info.size());
}

/*
  Recursive listing relative to dir.

  Staging files left behind by an interrupted copy are not part of
  any batch and are skipped.
*/
model::Manifest ArrowFsStore::Enumerate(const std::string& dir) {
  auto root = Unwrap(fs_->GetFileInfo(dir));
  if (root.type() == arrow::fs::FileType::NotFound) {
    throw std::runtime_error("directory not found: " + dir);
  }
  if (root.type() != arrow::fs::FileType::Directory) {
    throw std::runtime_error("not a directory: " + dir);
  }

  arrow::fs::FileSelector selector;
  selector.base_dir  = dir;
  selector.recursive = true;

  model::Manifest manifest;
  for (const auto& info : Unwrap(fs_->GetFileInfo(selector))) {
    if (info.type() != arrow::fs::FileType::File) continue;
    if (IsStagingName(info.base_name())) continue;

    model::FileEntry entry;
    entry.relative_path    = RelativeTo(dir, info.path());
    entry.size_bytes       = static_cast<uint64_t>(info.size());
    entry.modified_time_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(info.mtime().time_since_epoch()).count();
    manifest.push_back(std::move(entry));
  }

  model::SortManifest(manifest);
  return manifest;
}

std::shared_ptr<arrow::io::InputStream> ArrowFsStore::OpenRead(const std::string& path) {
  return Unwrap(fs_->OpenInputStream(path));
}

std::shared_ptr<arrow::io::OutputStream> ArrowFsStore::OpenWrite(const std::string& path) {
  return Unwrap(fs_->OpenOutputStream(path));
}

void ArrowFsStore::CreateDirectory(const std::string& path) {
  Unwrap(fs_->CreateDir(path, /*recursive=*/true));
}

void ArrowFsStore::Rename(const std::string& from, const std::string& to) {
  Unwrap(fs_->Move(from, to));
}

void ArrowFsStore::Remove(const std::string& path) {
  Unwrap(fs_->DeleteFile(path));
}

} // namespace batchsync::storage
