#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/batch_item.hpp"

namespace batchsync::model {

enum class TransferStatus : std::uint8_t {
  kCompleted = 0,
  kFailed    = 1,
  kCancelled = 2, // not started, or stopped at a checkpoint and left resumable
  kSkipped   = 3, // classified unchanged
};

const char* TransferStatusName(TransferStatus status);

struct TransferOutcome {
  TransferStatus status = TransferStatus::kCompleted;
  std::string    reason;
  uint64_t       files_copied = 0;
  uint64_t       bytes_copied = 0;
  // Attempts spent on the file that failed; 0 when nothing failed.
  uint32_t attempts = 0;

  static TransferOutcome Completed(uint64_t files, uint64_t bytes) {
    return {TransferStatus::kCompleted, {}, files, bytes, 0};
  }

  static TransferOutcome Failed(std::string reason, uint32_t attempts = 0) {
    return {TransferStatus::kFailed, std::move(reason), 0, 0, attempts};
  }

  static TransferOutcome Cancelled(uint64_t files, uint64_t bytes) {
    return {TransferStatus::kCancelled, "cancelled", files, bytes, 0};
  }
};

struct ItemReport {
  std::string batch_id;
  // Empty when the batch could not be classified (source unreadable).
  std::optional<Classification> classification;
  TransferOutcome               outcome;
};

/*
  Aggregate result of one run.

  Produced by the run coordinator. Not persisted; the caller logs it or
  hands it to a notifier.
*/
struct RunSummary {
  std::string run_id;

  uint64_t qualifying          = 0;
  uint64_t new_items           = 0;
  uint64_t modified_items      = 0;
  uint64_t unchanged_items     = 0;
  uint64_t destination_missing = 0;

  uint64_t completed = 0;
  uint64_t failed    = 0;
  uint64_t skipped   = 0;
  uint64_t cancelled = 0;

  uint64_t files_copied = 0;
  uint64_t bytes_copied = 0;

  std::chrono::milliseconds elapsed{0};

  std::vector<ItemReport> items;

  bool AllSucceeded() const {
    return failed == 0 && cancelled == 0;
  }

  void CountClassification(Classification c);
  void CountOutcome(const ItemReport& report);
};

// Human readable size, e.g. "512 B", "1.5 KB", "3.2 MB", "1.25 GB".
std::string FormatBytes(uint64_t bytes);

// Multi-line report suitable for a notification body.
std::string FormatRunSummary(const RunSummary& summary);

} // namespace batchsync::model
