#pragma once

#include <memory>
#include <string>

#include "internal/detect/change_detector.hpp"
#include "internal/filter/filter_criteria.hpp"
#include "internal/ledger/transaction_ledger.hpp"
#include "internal/model/record.hpp"
#include "internal/model/run_summary.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/transfer/cancellation.hpp"
#include "internal/transfer/transfer_options.hpp"

namespace batchsync::coordinator {

struct CoordinatorOptions {
  uint32_t                  worker_pool_size = 4;
  transfer::TransferOptions transfer;
  detect::DetectOptions     detect;

  // Filter and classify only; nothing is copied and the ledger is not written.
  bool dry_run = false;
};

/*
  One end-to-end pass:

      filter → classify → close stale pending → execute (worker pool) → summarize

  Item failures are reported in the summary. Only
  util::MalformedRecordSource and util::LedgerWriteError leave RunOnce.

  Cancel() may be called from any thread. Running transfers stop at
  their next file boundary; batches not yet started are reported as
  cancelled. Once cancelled, a coordinator stays cancelled.
*/
class RunCoordinator {
 public:
  explicit RunCoordinator(CoordinatorOptions options);

  model::RunSummary RunOnce(const model::RecordSet& records, const filter::FilterCriteria& criteria, const storage::StorageLocation& source,
                            const storage::StorageLocation& destination, ledger::TransactionLedger& ledger);

  void Cancel();

  bool cancelled() const {
    return cancel_->IsCancelled();
  }

  const CoordinatorOptions& options() const {
    return options_;
  }

 private:
  CoordinatorOptions                           options_;
  std::shared_ptr<transfer::CancellationToken> cancel_;
};

} // namespace batchsync::coordinator
