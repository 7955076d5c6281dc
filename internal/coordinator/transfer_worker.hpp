#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/ledger/transaction_ledger.hpp"
#include "internal/model/run_summary.hpp"
#include "internal/transfer/cancellation.hpp"
#include "internal/transfer/transfer_executor.hpp"
#include "transfer_queue.hpp"

namespace batchsync::coordinator {

/*
  First fatal error raised by any worker of a run.
*/
class FatalError {
 public:
  void Capture(std::exception_ptr error) {
    std::lock_guard lock(mutex_);
    if (!error_) error_ = std::move(error);
  }

  void RethrowIfSet() {
    std::lock_guard lock(mutex_);
    if (error_) std::rethrow_exception(error_);
  }

 private:
  std::mutex         mutex_;
  std::exception_ptr error_;
};

/*
  Pool thread executing queued batches.

  Per task:
      cancelled? → report Cancelled, ledger untouched
      else       → TransferExecutor::Execute

  A fatal error (ledger unwritable) is captured, cancels the rest of
  the run, and stops this worker.
*/
class TransferWorker {
 public:
  using Sink = std::function<void(size_t slot, const model::TransferOutcome&)>;

  TransferWorker(std::shared_ptr<TransferQueue> queue, transfer::TransferExecutor& executor, ledger::TransactionLedger& ledger, std::string run_id,
                 std::shared_ptr<transfer::CancellationToken> cancel, std::shared_ptr<FatalError> fatal, Sink sink);
  ~TransferWorker();

  TransferWorker(const TransferWorker&)            = delete;
  TransferWorker& operator=(const TransferWorker&) = delete;

  void Start();
  void Join();

 private:
  void Run();

  std::shared_ptr<TransferQueue>               queue_;
  transfer::TransferExecutor&                  executor_;
  ledger::TransactionLedger&                   ledger_;
  std::string                                  run_id_;
  std::shared_ptr<transfer::CancellationToken> cancel_;
  std::shared_ptr<FatalError>                  fatal_;
  Sink                                         sink_;

  std::thread thread_;
};

} // namespace batchsync::coordinator
