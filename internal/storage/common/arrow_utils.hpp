#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace batchsync::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read an entire stream into a string
*/
std::string ReadAll(const std::shared_ptr<arrow::io::InputStream>& input, int64_t chunk_bytes = 1 << 20);

/*
  Resolve a configured root into a filesystem and a backend path.

    "/data/batches"         → LocalFileSystem, "/data/batches"
    "relative/dir"          → LocalFileSystem, absolute form of it
    "s3://bucket/prefix"    → S3FileSystem,   "bucket/prefix"
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& root);

} // namespace batchsync::storage::common
