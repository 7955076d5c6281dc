#pragma once

#include <memory>
#include <string>

#include "internal/ledger/transaction_ledger.hpp"
#include "internal/model/batch_item.hpp"
#include "internal/model/run_summary.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/transfer/cancellation.hpp"
#include "internal/transfer/transfer_options.hpp"
#include "internal/util/result.hpp"

namespace batchsync::transfer {

/*
  Copies one classified batch and drives its ledger transaction.

  Per item:

      Begin / Resume
         │
         ▼
      for each file not checkpointed:
         copy (staging → rename), retried with backoff
         FILE_COPIED
         │
         ▼
      verify sizes (and SHA-256 if enabled)
         │
         ▼
      VERIFIED → COMPLETED

  Failures end the transaction with FAILED and are returned as data.
  Cancellation is honoured between files and during backoff; the
  transaction is then left pending and resumable.

  util::LedgerWriteError is the only exception that escapes Execute.

  Source files are only ever read.
*/
class TransferExecutor {
 public:
  TransferExecutor(storage::StorageBackendPtr source, storage::StorageBackendPtr destination, TransferOptions options,
                   std::shared_ptr<CancellationToken> cancel = nullptr);

  model::TransferOutcome Execute(const model::BatchItem& item, ledger::TransactionLedger& ledger, const std::string& run_id);

  const TransferOptions& options() const {
    return options_;
  }

 private:
  ledger::TransactionHandle OpenTransaction(const model::BatchItem& item, ledger::TransactionLedger& ledger, const std::string& run_id);

  model::TransferOutcome Transfer(const model::BatchItem& item, ledger::TransactionHandle& handle, ledger::TransactionLedger& ledger);

  util::Result CopyWithRetry(const std::string& source_path, const std::string& destination_path, const model::FileEntry& entry,
                             uint32_t& attempts);
  util::Result CopyOnce(const std::string& source_path, const std::string& destination_path, const model::FileEntry& entry);
  util::Result Verify(const std::string& source_path, const std::string& destination_path, model::FileEntry& entry);

  bool AlreadyAtDestination(const std::string& destination_path, const model::FileEntry& entry);
  bool Cancelled() const;
  bool WaitOrCancelled(std::chrono::milliseconds delay);

  storage::StorageBackendPtr         source_;
  storage::StorageBackendPtr         destination_;
  TransferOptions                    options_;
  std::shared_ptr<CancellationToken> cancel_;
};

// Hidden staging name beside path: "<dir>/.<name>.<uuid>.batchsync-tmp".
std::string StagingPathFor(const std::string& path);

} // namespace batchsync::transfer
