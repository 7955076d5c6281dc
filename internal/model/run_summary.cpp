#include "run_summary.hpp"

#include <cstdio>
#include <sstream>

namespace batchsync::model {

const char* TransferStatusName(TransferStatus status) {
  switch (status) {
    case TransferStatus::kCompleted:
      return "completed";
    case TransferStatus::kFailed:
      return "failed";
    case TransferStatus::kCancelled:
      return "cancelled";
    case TransferStatus::kSkipped:
      return "skipped";
  }
  return "unknown";
}

void RunSummary::CountClassification(Classification c) {
  switch (c) {
    case Classification::kNew:
      ++new_items;
      break;
    case Classification::kModified:
      ++modified_items;
      break;
    case Classification::kUnchanged:
      ++unchanged_items;
      break;
    case Classification::kDestinationMissing:
      ++destination_missing;
      break;
  }
}

void RunSummary::CountOutcome(const ItemReport& report) {
  switch (report.outcome.status) {
    case TransferStatus::kCompleted:
      ++completed;
      break;
    case TransferStatus::kFailed:
      ++failed;
      break;
    case TransferStatus::kCancelled:
      ++cancelled;
      break;
    case TransferStatus::kSkipped:
      ++skipped;
      break;
  }
  files_copied += report.outcome.files_copied;
  bytes_copied += report.outcome.bytes_copied;
  items.push_back(report);
}

std::string FormatBytes(uint64_t bytes) {
  char buf[32];
  if (bytes < 1024) {
    std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
  } else if (bytes < 1024ull * 1024) {
    std::snprintf(buf, sizeof(buf), "%.1f KB", static_cast<double>(bytes) / 1024.0);
  } else if (bytes < 1024ull * 1024 * 1024) {
    std::snprintf(buf, sizeof(buf), "%.1f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
  } else {
    std::snprintf(buf, sizeof(buf), "%.2f GB", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
  }
  return buf;
}

std::string FormatRunSummary(const RunSummary& summary) {
  std::ostringstream out;
  out << "Run " << summary.run_id << (summary.AllSucceeded() ? " succeeded" : " finished with problems") << "\n";
  out << "  qualifying batches: " << summary.qualifying << " (new " << summary.new_items << ", modified " << summary.modified_items
      << ", unchanged " << summary.unchanged_items << ", destination missing " << summary.destination_missing << ")\n";
  out << "  completed: " << summary.completed << ", failed: " << summary.failed << ", skipped: " << summary.skipped
      << ", cancelled: " << summary.cancelled << "\n";
  out << "  files copied: " << summary.files_copied << " (" << FormatBytes(summary.bytes_copied) << ")\n";
  out << "  elapsed: " << summary.elapsed.count() << " ms\n";

  for (const auto& item : summary.items) {
    if (item.outcome.status == TransferStatus::kSkipped) continue;
    out << "  - " << item.batch_id << " [" << (item.classification ? ClassificationName(*item.classification) : "unreadable") << "] "
        << TransferStatusName(item.outcome.status);
    if (!item.outcome.reason.empty() && item.outcome.status != TransferStatus::kCompleted) {
      out << ": " << item.outcome.reason;
    }
    out << "\n";
  }
  return out.str();
}

} // namespace batchsync::model
