#pragma once

#include <arrow/io/interfaces.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/manifest.hpp"

namespace batchsync::storage {

/*
  Storage capability the engine depends on.

  Paths are backend paths (absolute local paths or the path part of a
  filesystem URI), '/' separated. Errors are thrown as
  std::runtime_error carrying the backend's message.

  Implementations:
    ArrowFsStore → any arrow::fs::FileSystem (local disk, mapped
                   network drive, s3://, ...)
*/

class StorageBackend {
 public:
  virtual ~StorageBackend() = default;

  // ------------------------------------------------------------------
  // Probing
  // ------------------------------------------------------------------
  /*
    True if root exists and is a directory. Never throws.
  */
  virtual bool IsAccessible(const std::string& root) = 0;

  virtual bool DirectoryExists(const std::string& path) = 0;

  // Names of the immediate child directories of path.
  virtual std::vector<std::string> ListDirectories(const std::string& path) = 0;

  // Size of a regular file, nullopt if absent.
  virtual std::optional<uint64_t> FileSize(const std::string& path) = 0;

  // ------------------------------------------------------------------
  // Enumerate
  // ------------------------------------------------------------------
  /*
    Every regular file below dir, recursively, with paths relative to
    dir. Sorted by relative path. Throws if dir cannot be listed.
  */
  virtual model::Manifest Enumerate(const std::string& dir) = 0;

  // ------------------------------------------------------------------
  // Read / write
  // ------------------------------------------------------------------
  virtual std::shared_ptr<arrow::io::InputStream> OpenRead(const std::string& path) = 0;

  // Truncates an existing file.
  virtual std::shared_ptr<arrow::io::OutputStream> OpenWrite(const std::string& path) = 0;

  // Recursive; succeeds if the directory already exists.
  virtual void CreateDirectory(const std::string& path) = 0;

  // Atomically replaces `to` where the backend supports it.
  virtual void Rename(const std::string& from, const std::string& to) = 0;

  virtual void Remove(const std::string& path) = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

/*
  A backend plus the directory batches live under.
*/
struct StorageLocation {
  StorageBackendPtr backend;
  std::string       root;

  std::string PathOf(const std::string& name) const;
};

} // namespace batchsync::storage
