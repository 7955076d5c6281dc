#include "manifest.hpp"

#include <algorithm>

namespace batchsync::model {

void SortManifest(Manifest& manifest) {
  std::sort(manifest.begin(), manifest.end(), [](const FileEntry& a, const FileEntry& b) { return a.relative_path < b.relative_path; });
}

bool SameFile(const FileEntry& a, const FileEntry& b, int64_t mtime_tolerance_ns) {
  if (a.size_bytes != b.size_bytes) return false;
  const int64_t delta = a.modified_time_ns > b.modified_time_ns ? a.modified_time_ns - b.modified_time_ns : b.modified_time_ns - a.modified_time_ns;
  return delta <= mtime_tolerance_ns;
}

bool SameManifest(const Manifest& a, const Manifest& b, int64_t mtime_tolerance_ns) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].relative_path != b[i].relative_path) return false;
    if (!SameFile(a[i], b[i], mtime_tolerance_ns)) return false;
  }
  return true;
}

std::optional<FileEntry> FindEntry(const Manifest& manifest, const std::string& relative_path) {
  auto it = std::lower_bound(manifest.begin(), manifest.end(), relative_path,
                             [](const FileEntry& entry, const std::string& path) { return entry.relative_path < path; });
  if (it == manifest.end() || it->relative_path != relative_path) return std::nullopt;
  return *it;
}

uint64_t TotalBytes(const Manifest& manifest) {
  uint64_t total = 0;
  for (const auto& entry : manifest) total += entry.size_bytes;
  return total;
}

} // namespace batchsync::model
