#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace batchsync::model {

struct FileEntry {
  std::string relative_path; // '/' separated, relative to the batch directory
  uint64_t    size_bytes       = 0;
  int64_t     modified_time_ns = 0;
  std::string sha256; // empty unless checksums were computed
};

// Always sorted by relative_path.
using Manifest = std::vector<FileEntry>;

void SortManifest(Manifest& manifest);

// Size equal and modification times within tolerance. Checksums are not compared.
bool SameFile(const FileEntry& a, const FileEntry& b, int64_t mtime_tolerance_ns = 0);

// Same set of paths and SameFile for every pair.
bool SameManifest(const Manifest& a, const Manifest& b, int64_t mtime_tolerance_ns = 0);

std::optional<FileEntry> FindEntry(const Manifest& manifest, const std::string& relative_path);

uint64_t TotalBytes(const Manifest& manifest);

} // namespace batchsync::model
