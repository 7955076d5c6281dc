#include "transfer_executor.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>

#include "internal/model/failure_reason.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/transfer/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace batchsync::transfer {

using model::TransferOutcome;
using observability::IntField;
using observability::StringField;
using storage::common::JoinPath;
using storage::common::Unwrap;
using util::ErrorCode;
using util::Result;

std::string StagingPathFor(const std::string& path) {
  const auto parent = storage::common::ParentPath(path);
  const auto name   = "." + storage::common::BaseName(path) + "." + util::ToString(util::GenerateUUID()).substr(0, 8) +
                    storage::common::kStagingSuffix;
  return parent.empty() ? name : JoinPath(parent, name);
}

TransferExecutor::TransferExecutor(storage::StorageBackendPtr source, storage::StorageBackendPtr destination, TransferOptions options,
                                   std::shared_ptr<CancellationToken> cancel)
    : source_(std::move(source)), destination_(std::move(destination)), options_(options), cancel_(std::move(cancel)) {
}

// ---------------------------------------------------------------------------
// Item
// ---------------------------------------------------------------------------

TransferOutcome TransferExecutor::Execute(const model::BatchItem& item, ledger::TransactionLedger& ledger, const std::string& run_id) {
  std::optional<ledger::TransactionHandle> handle;
  try {
    handle = OpenTransaction(item, ledger, run_id);
    return Transfer(item, *handle, ledger);
  } catch (const util::LedgerWriteError&) {
    throw;
  } catch (const std::exception& e) {
    const auto reason = model::FailureReason(model::kUnexpectedError, e.what());
    BATCHSYNC_LOG_ERROR("transfer aborted", {StringField("batch_id", item.batch_id), StringField("error", e.what())});

    if (handle) {
      try {
        ledger.RecordFailed(*handle, reason);
      } catch (const util::InvalidState& state_error) {
        BATCHSYNC_LOG_WARN("transaction already closed", {StringField("batch_id", item.batch_id), StringField("error", state_error.what())});
      }
    }
    return TransferOutcome::Failed(reason);
  }
}

/*
  A pending transaction for the same manifest is resumed; one for a
  different manifest is closed as superseded before a new one starts.
*/
ledger::TransactionHandle TransferExecutor::OpenTransaction(const model::BatchItem& item, ledger::TransactionLedger& ledger, const std::string& run_id) {
  if (auto pending = ledger.PendingFor(item.batch_id)) {
    const auto tolerance_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(options_.mtime_tolerance).count();
    if (model::SameManifest(pending->manifest, item.file_manifest, tolerance_ns)) {
      if (auto resumed = ledger.Resume(pending->run_id, item.batch_id)) {
        return std::move(*resumed);
      }
    } else {
      ledger.FailPending(pending->run_id, item.batch_id, model::FailureReason(model::kSuperseded, run_id));
    }
  }
  return ledger.Begin(run_id, item.batch_id, item.file_manifest);
}

TransferOutcome TransferExecutor::Transfer(const model::BatchItem& item, ledger::TransactionHandle& handle, ledger::TransactionLedger& ledger) {
  const auto start = std::chrono::steady_clock::now();

  destination_->CreateDirectory(item.destination_path);

  uint64_t files = 0;
  uint64_t bytes = 0;

  for (const auto& entry : handle.manifest()) {
    if (Cancelled()) {
      BATCHSYNC_LOG_WARN("transfer cancelled", {StringField("batch_id", item.batch_id), IntField("files_copied", static_cast<int64_t>(files))});
      return TransferOutcome::Cancelled(files, bytes);
    }

    const auto source_path      = JoinPath(item.source_path, entry.relative_path);
    const auto destination_path = JoinPath(item.destination_path, entry.relative_path);

    if (handle.IsCheckpointed(entry.relative_path) && AlreadyAtDestination(destination_path, entry)) {
      BATCHSYNC_LOG_DEBUG("file already copied", {StringField("batch_id", item.batch_id), StringField("path", entry.relative_path)});
      continue;
    }

    uint32_t attempts = 0;
    auto     result   = CopyWithRetry(source_path, destination_path, entry, attempts);
    if (result.code == ErrorCode::Cancelled) {
      return TransferOutcome::Cancelled(files, bytes);
    }
    if (!result) {
      const auto reason = model::FailureReason(model::kCopyError, entry.relative_path);
      ledger.RecordFailed(handle, reason, attempts);

      auto outcome         = TransferOutcome::Failed(reason, attempts);
      outcome.files_copied = files;
      outcome.bytes_copied = bytes;
      return outcome;
    }

    // a VERIFIED transaction only moves on to COMPLETED; the re-copy is covered by the verification below
    if (handle.phase() != batchsync::ledger::v1::PHASE_VERIFIED) {
      ledger.RecordFileCopied(handle, entry.relative_path, attempts);
    }
    ++files;
    bytes += entry.size_bytes;
  }

  // verification covers every file, including the ones copied by earlier runs
  model::Manifest verified = handle.manifest();
  for (auto& entry : verified) {
    const auto source_path      = JoinPath(item.source_path, entry.relative_path);
    const auto destination_path = JoinPath(item.destination_path, entry.relative_path);

    auto result = Verify(source_path, destination_path, entry);
    if (!result) {
      const auto reason = model::FailureReason(model::kVerificationMismatch, entry.relative_path);
      BATCHSYNC_LOG_ERROR("verification failed", {StringField("batch_id", item.batch_id), StringField("path", entry.relative_path),
                                                  StringField("code", util::ErrorCodeName(result.code)), StringField("error", result.message)});
      ledger.RecordFailed(handle, reason);

      auto outcome         = TransferOutcome::Failed(reason);
      outcome.files_copied = files;
      outcome.bytes_copied = bytes;
      return outcome;
    }
  }

  if (handle.phase() != batchsync::ledger::v1::PHASE_VERIFIED) {
    ledger.RecordVerified(handle);
  }
  ledger.RecordCompleted(handle, verified);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  BATCHSYNC_LOG_INFO("transfer completed", {StringField("batch_id", item.batch_id), IntField("files_copied", static_cast<int64_t>(files)),
                                            IntField("bytes_copied", static_cast<int64_t>(bytes)), IntField("elapsed_ms", elapsed.count())});
  return TransferOutcome::Completed(files, bytes);
}

// ---------------------------------------------------------------------------
// File
// ---------------------------------------------------------------------------

Result TransferExecutor::CopyWithRetry(const std::string& source_path, const std::string& destination_path, const model::FileEntry& entry,
                                       uint32_t& attempts) {
  const uint32_t max_attempts = std::max<uint32_t>(options_.max_copy_retries, 1);

  Result result;
  for (attempts = 1;; ++attempts) {
    result = CopyOnce(source_path, destination_path, entry);
    if (result) return result;

    BATCHSYNC_LOG_WARN("copy attempt failed", {StringField("path", source_path), IntField("attempt", attempts), IntField("max_attempts", max_attempts),
                                               StringField("code", util::ErrorCodeName(result.code)), StringField("error", result.message)});
    if (attempts >= max_attempts) return result;

    if (WaitOrCancelled(options_.BackoffFor(attempts))) {
      return Result::Err(ErrorCode::Cancelled, "cancelled during retry backoff");
    }
  }
}

/*
  One attempt: stream into a staging file, then rename over the final
  path. Anything short of the rename leaves the final path untouched;
  the staging file is removed on failure.
*/
Result TransferExecutor::CopyOnce(const std::string& source_path, const std::string& destination_path, const model::FileEntry& entry) {
  const auto staging  = StagingPathFor(destination_path);
  const auto deadline = std::chrono::steady_clock::now() + options_.copy_timeout;

  std::shared_ptr<arrow::io::OutputStream> out;
  auto                                     discard = [&]() {
    out.reset();
    try {
      if (destination_->FileSize(staging)) destination_->Remove(staging);
    } catch (const std::exception& e) {
      BATCHSYNC_LOG_WARN("staging cleanup failed", {StringField("path", staging), StringField("error", e.what())});
    }
  };

  try {
    const auto parent = storage::common::ParentPath(destination_path);
    if (!parent.empty()) destination_->CreateDirectory(parent);

    auto in = source_->OpenRead(source_path);
    out     = destination_->OpenWrite(staging);

    const auto chunk  = static_cast<int64_t>(std::max<uint64_t>(options_.copy_chunk_bytes, 1));
    uint64_t   copied = 0;
    while (true) {
      auto buffer = Unwrap(in->Read(chunk));

      // checked after every read, the final empty one included
      if (std::chrono::steady_clock::now() > deadline) {
        discard();
        return Result::Err(ErrorCode::Timeout, "copy exceeded " + std::to_string(options_.copy_timeout.count()) + " ms");
      }
      if (buffer->size() == 0) break;

      Unwrap(out->Write(buffer));
      copied += static_cast<uint64_t>(buffer->size());
    }
    Unwrap(out->Close());
    Unwrap(in->Close());

    if (copied != entry.size_bytes) {
      discard();
      return Result::Err(ErrorCode::Mismatch, "read " + std::to_string(copied) + " bytes, expected " + std::to_string(entry.size_bytes));
    }

    destination_->Rename(staging, destination_path);
    return Result::Ok();
  } catch (const std::exception& e) {
    discard();
    return Result::Err(ErrorCode::IOError, e.what());
  }
}

Result TransferExecutor::Verify(const std::string& source_path, const std::string& destination_path, model::FileEntry& entry) {
  try {
    auto size = destination_->FileSize(destination_path);
    if (!size) {
      return Result::Err(ErrorCode::NotFound, "destination file missing");
    }
    if (*size != entry.size_bytes) {
      return Result::Err(ErrorCode::Mismatch, "size " + std::to_string(*size) + " != " + std::to_string(entry.size_bytes));
    }
    if (!options_.verify_checksum) {
      return Result::Ok();
    }

    const auto chunk           = static_cast<int64_t>(std::max<uint64_t>(options_.copy_chunk_bytes, 1));
    const auto source_digest   = Sha256Hex(source_->OpenRead(source_path), chunk);
    const auto destination_dig = Sha256Hex(destination_->OpenRead(destination_path), chunk);
    if (source_digest != destination_dig) {
      return Result::Err(ErrorCode::Mismatch, "sha256 " + destination_dig + " != " + source_digest);
    }
    entry.sha256 = source_digest;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
}

bool TransferExecutor::AlreadyAtDestination(const std::string& destination_path, const model::FileEntry& entry) {
  try {
    auto size = destination_->FileSize(destination_path);
    return size && *size == entry.size_bytes;
  } catch (const std::exception& e) {
    BATCHSYNC_LOG_WARN("destination probe failed", {StringField("path", destination_path), StringField("error", e.what())});
    return false;
  }
}

bool TransferExecutor::Cancelled() const {
  return cancel_ && cancel_->IsCancelled();
}

bool TransferExecutor::WaitOrCancelled(std::chrono::milliseconds delay) {
  if (delay.count() <= 0) return Cancelled();
  if (cancel_) return cancel_->WaitFor(delay);
  std::this_thread::sleep_for(delay);
  return false;
}

} // namespace batchsync::transfer
