#include "change_detector.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace batchsync::detect {

using model::Classification;
using observability::IntField;
using observability::StringField;

namespace {

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

bool DestinationExists(const storage::StorageLocation& destination, const std::string& path) {
  try {
    return destination.backend->DirectoryExists(path);
  } catch (const std::exception& e) {
    BATCHSYNC_LOG_WARN("destination probe failed", {StringField("path", path), StringField("error", e.what())});
    return false;
  }
}

Classification ClassifyAgainstLedger(const std::string& batch_id, const model::Manifest& manifest, const ledger::TransactionLedger& ledger,
                                     const DetectOptions& options) {
  auto completed = ledger.LatestCompletedManifest(batch_id);
  if (!completed) {
    return Classification::kNew;
  }

  // an attempt since the last completion that may have written leaves the destination untrusted
  if (ledger.DestinationTouchedSinceCompleted(batch_id)) {
    return Classification::kModified;
  }

  const auto tolerance_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(options.mtime_tolerance).count();
  return model::SameManifest(manifest, *completed, tolerance_ns) ? Classification::kUnchanged : Classification::kModified;
}

} // namespace

std::optional<std::string> LocateSourceDirectory(const std::string& batch_id, const storage::StorageLocation& source) {
  if (source.backend->DirectoryExists(source.PathOf(batch_id))) {
    return batch_id;
  }

  for (const auto& name : source.backend->ListDirectories(source.root)) {
    if (EqualsIgnoreCase(name, batch_id)) return name;
  }
  return std::nullopt;
}

model::BatchItem Classify(const std::string& batch_id, const storage::StorageLocation& source, const storage::StorageLocation& destination,
                          const ledger::TransactionLedger& ledger, const DetectOptions& options) {
  model::BatchItem item;
  item.batch_id = batch_id;

  try {
    storage::common::ValidateBatchId(batch_id);

    auto directory = LocateSourceDirectory(batch_id, source);
    if (!directory) {
      throw util::SourceUnreadable(batch_id, "source directory not found under " + source.root);
    }

    item.source_path      = source.PathOf(*directory);
    item.destination_path = destination.PathOf(*directory);
    item.file_manifest    = source.backend->Enumerate(item.source_path);
  } catch (const util::SourceUnreadable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::SourceUnreadable(batch_id, e.what());
  }

  if (!DestinationExists(destination, item.destination_path)) {
    item.classification = Classification::kDestinationMissing;
  } else {
    item.classification = ClassifyAgainstLedger(batch_id, item.file_manifest, ledger, options);
  }

  BATCHSYNC_LOG_INFO("batch classified", {StringField("batch_id", batch_id), StringField("classification", model::ClassificationName(item.classification)),
                                          IntField("files", static_cast<int64_t>(item.file_manifest.size())),
                                          IntField("bytes", static_cast<int64_t>(model::TotalBytes(item.file_manifest)))});
  return item;
}

} // namespace batchsync::detect
