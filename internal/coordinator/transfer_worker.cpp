#include "transfer_worker.hpp"

#include "internal/observability/logging.hpp"

namespace batchsync::coordinator {

TransferWorker::TransferWorker(std::shared_ptr<TransferQueue> queue, transfer::TransferExecutor& executor, ledger::TransactionLedger& ledger,
                               std::string run_id, std::shared_ptr<transfer::CancellationToken> cancel, std::shared_ptr<FatalError> fatal, Sink sink)
    : queue_(std::move(queue)),
      executor_(executor),
      ledger_(ledger),
      run_id_(std::move(run_id)),
      cancel_(std::move(cancel)),
      fatal_(std::move(fatal)),
      sink_(std::move(sink)) {
}

TransferWorker::~TransferWorker() {
  Join();
}

void TransferWorker::Start() {
  thread_ = std::thread(&TransferWorker::Run, this);
}

void TransferWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void TransferWorker::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    if (cancel_->IsCancelled()) {
      sink_(task->slot, model::TransferOutcome::Cancelled(0, 0));
      continue;
    }

    try {
      sink_(task->slot, executor_.Execute(task->item, ledger_, run_id_));
    } catch (const std::exception& e) {
      BATCHSYNC_LOG_ERROR("transfer worker stopped", {observability::StringField("batch_id", task->item.batch_id),
                                                      observability::StringField("error", e.what())});
      fatal_->Capture(std::current_exception());
      cancel_->Cancel();
      return;
    }
  }
}

} // namespace batchsync::coordinator
