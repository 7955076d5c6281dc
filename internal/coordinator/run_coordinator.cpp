#include "run_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <vector>

#include "internal/coordinator/transfer_queue.hpp"
#include "internal/coordinator/transfer_worker.hpp"
#include "internal/filter/record_filter.hpp"
#include "internal/model/failure_reason.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transfer/transfer_executor.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace batchsync::coordinator {

using model::Classification;
using model::ItemReport;
using model::TransferOutcome;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

/*
  Pending transactions of batches this run will not execute are closed
  so they neither block nor confuse the next run. Actionable batches
  keep theirs: the executor resumes or supersedes them.
*/
void CloseStalePending(ledger::TransactionLedger& ledger, const std::string& run_id, const std::map<std::string, std::string>& not_actionable,
                       const std::set<std::string>& qualifying) {
  for (const auto& pending : ledger.PendingIncomplete()) {
    std::string why;
    if (auto it = not_actionable.find(pending.batch_id); it != not_actionable.end()) {
      why = it->second;
    } else if (!qualifying.contains(pending.batch_id)) {
      why = "not-qualifying";
    } else {
      continue;
    }
    ledger.FailPending(pending.run_id, pending.batch_id, model::FailureReason(model::kAbandoned, why + ":" + run_id));
  }
}

void RecordUnreadable(ledger::TransactionLedger& ledger, const std::string& run_id, const std::string& batch_id, const std::string& reason) {
  auto handle = ledger.Begin(run_id, batch_id, {});
  ledger.RecordFailed(handle, reason);
}

} // namespace

RunCoordinator::RunCoordinator(CoordinatorOptions options)
    : options_(std::move(options)), cancel_(std::make_shared<transfer::CancellationToken>()) {
}

void RunCoordinator::Cancel() {
  if (!cancel_->IsCancelled()) {
    BATCHSYNC_LOG_WARN("run cancellation requested");
  }
  cancel_->Cancel();
}

model::RunSummary RunCoordinator::RunOnce(const model::RecordSet& records, const filter::FilterCriteria& criteria,
                                          const storage::StorageLocation& source, const storage::StorageLocation& destination,
                                          ledger::TransactionLedger& ledger) {
  const auto start = std::chrono::steady_clock::now();

  model::RunSummary summary;
  summary.run_id = util::GenerateRunId();

  // ------------------------------------------------------------------
  // Filter
  // ------------------------------------------------------------------
  const auto qualifying = filter::Filter(records, criteria);
  summary.qualifying    = qualifying.size();

  BATCHSYNC_LOG_INFO("run started", {StringField("run_id", summary.run_id), IntField("records", static_cast<int64_t>(records.rows.size())),
                                     IntField("qualifying", static_cast<int64_t>(qualifying.size())), BoolField("dry_run", options_.dry_run)});

  // ------------------------------------------------------------------
  // Classify
  // ------------------------------------------------------------------
  std::vector<ItemReport>                          reports;
  std::vector<model::BatchItem>                    actionable;
  std::map<std::string, std::string>               not_actionable;
  std::vector<std::pair<std::string, std::string>> unreadable;

  for (const auto& batch_id : qualifying) {
    try {
      auto item = detect::Classify(batch_id, source, destination, ledger, options_.detect);
      summary.CountClassification(item.classification);

      if (!model::IsActionable(item.classification)) {
        not_actionable.emplace(batch_id, model::ClassificationName(item.classification));
        reports.push_back({batch_id, item.classification, {model::TransferStatus::kSkipped, {}, 0, 0, 0}});
        continue;
      }
      actionable.push_back(std::move(item));
    } catch (const util::SourceUnreadable& e) {
      const auto reason = model::FailureReason(model::kSourceUnreadable, e.what());
      BATCHSYNC_LOG_ERROR("source unreadable", {StringField("batch_id", batch_id), StringField("error", e.what())});

      not_actionable.emplace(batch_id, "source-unreadable");
      unreadable.emplace_back(batch_id, reason);
      reports.push_back({batch_id, std::nullopt, TransferOutcome::Failed(reason)});
    }
  }

  if (options_.dry_run) {
    for (const auto& item : actionable) {
      reports.push_back({item.batch_id, item.classification, {model::TransferStatus::kSkipped, "dry-run", 0, 0, 0}});
    }
  } else {
    CloseStalePending(ledger, summary.run_id, not_actionable, qualifying);
    for (const auto& [batch_id, reason] : unreadable) {
      RecordUnreadable(ledger, summary.run_id, batch_id, reason);
    }

    // ------------------------------------------------------------------
    // Execute
    // ------------------------------------------------------------------
    std::vector<TransferOutcome> outcomes(actionable.size(), TransferOutcome::Cancelled(0, 0));
    std::mutex                   outcomes_mutex;

    if (!actionable.empty()) {
      auto queue = std::make_shared<TransferQueue>();
      for (size_t i = 0; i < actionable.size(); ++i) {
        queue->Enqueue({i, actionable[i]});
      }
      queue->Shutdown();

      transfer::TransferExecutor executor(source.backend, destination.backend, options_.transfer, cancel_);
      auto                       fatal = std::make_shared<FatalError>();
      auto                       sink  = [&](size_t slot, const TransferOutcome& outcome) {
        std::lock_guard lock(outcomes_mutex);
        outcomes[slot] = outcome;
      };

      const size_t pool_size = std::min<size_t>(std::max<uint32_t>(options_.worker_pool_size, 1), actionable.size());

      std::vector<std::unique_ptr<TransferWorker>> workers;
      workers.reserve(pool_size);
      for (size_t i = 0; i < pool_size; ++i) {
        workers.push_back(std::make_unique<TransferWorker>(queue, executor, ledger, summary.run_id, cancel_, fatal, sink));
        workers.back()->Start();
      }
      for (auto& worker : workers) {
        worker->Join();
      }

      fatal->RethrowIfSet();
    }

    for (size_t i = 0; i < actionable.size(); ++i) {
      reports.push_back({actionable[i].batch_id, actionable[i].classification, outcomes[i]});
    }
  }

  // ------------------------------------------------------------------
  // Summarize
  // ------------------------------------------------------------------
  std::sort(reports.begin(), reports.end(), [](const ItemReport& a, const ItemReport& b) { return a.batch_id < b.batch_id; });
  for (const auto& report : reports) {
    summary.CountOutcome(report);
  }
  summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

  BATCHSYNC_LOG_INFO("run finished", {StringField("run_id", summary.run_id), IntField("completed", static_cast<int64_t>(summary.completed)),
                                      IntField("failed", static_cast<int64_t>(summary.failed)), IntField("skipped", static_cast<int64_t>(summary.skipped)),
                                      IntField("cancelled", static_cast<int64_t>(summary.cancelled)),
                                      IntField("bytes_copied", static_cast<int64_t>(summary.bytes_copied)), IntField("elapsed_ms", summary.elapsed.count())});
  return summary;
}

} // namespace batchsync::coordinator
