#include "internal/coordinator/run_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/ledger/store/memory_ledger_store.hpp"
#include "internal/model/failure_reason.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using batchsync::coordinator::CoordinatorOptions;
using batchsync::coordinator::RunCoordinator;
using batchsync::filter::FilterCriteria;
using batchsync::ledger::MemoryLedgerStore;
using batchsync::ledger::TransactionLedger;
using batchsync::model::Classification;
using batchsync::model::RecordSet;
using batchsync::model::TransferStatus;
using batchsync::storage::StorageLocation;
using batchsync::testing::LocalLocation;
using batchsync::testing::MakeRecords;
using batchsync::testing::TempDir;
using batchsync::testing::WriteFile;
using namespace batchsync::ledger::v1;

const FilterCriteria kCriteria{"Status", "Ready", "Archived"};

CoordinatorOptions FastOptions() {
  CoordinatorOptions options;
  options.worker_pool_size            = 2;
  options.transfer.retry_backoff_base = std::chrono::milliseconds(1);
  options.transfer.retry_backoff_max  = std::chrono::milliseconds(2);
  return options;
}

struct Fixture {
  TempDir         dir{"run_coordinator"};
  StorageLocation source      = LocalLocation(dir / "source");
  StorageLocation destination = LocalLocation(dir / "destination");

  void AddBatch(const std::string& batch_id, int files = 2) {
    for (int i = 0; i < files; ++i) {
      WriteFile(dir / "source" / batch_id / ("file" + std::to_string(i) + ".raw"), batch_id + ":" + std::to_string(i));
    }
  }
};

RecordSet MixedRecords() {
  return MakeRecords({"Batch ID", "Status", "Archived"}, {
                                                             {"B1", "Ready", ""},
                                                             {"B2", "Pending", ""},
                                                             {"B3", "Ready", ""},
                                                             {"B4", "Ready", ""},
                                                         });
}

void TestMixedRunAndRerun() {
  Fixture f;
  f.AddBatch("B1");
  f.AddBatch("B2");
  f.AddBatch("B4", 3);

  TransactionLedger ledger(std::make_shared<MemoryLedgerStore>());
  RunCoordinator    coordinator(FastOptions());

  auto summary = coordinator.RunOnce(MixedRecords(), kCriteria, f.source, f.destination, ledger);
  assert(summary.qualifying == 3);
  assert(summary.destination_missing == 2);
  assert(summary.completed == 2);
  assert(summary.failed == 1);
  assert(summary.files_copied == 5);
  assert(!summary.AllSucceeded());

  assert(summary.items.size() == 3);
  assert(summary.items[0].batch_id == "B1");
  assert(summary.items[1].batch_id == "B3");
  assert(!summary.items[1].classification);
  assert(batchsync::model::HasReasonPrefix(summary.items[1].outcome.reason, batchsync::model::kSourceUnreadable));
  assert(!std::filesystem::exists(f.dir / "destination" / "B2"));
  assert(std::filesystem::exists(f.dir / "destination" / "B4" / "file2.raw"));

  auto unreadable = ledger.History("B3");
  assert(unreadable.size() == 2);
  assert(unreadable[0].phase() == PHASE_STARTED);
  assert(unreadable[1].phase() == PHASE_FAILED);

  auto again = coordinator.RunOnce(MixedRecords(), kCriteria, f.source, f.destination, ledger);
  assert(again.run_id != summary.run_id);
  assert(again.unchanged_items == 2);
  assert(again.skipped == 2);
  assert(again.completed == 0);
  assert(again.files_copied == 0);
  assert(again.failed == 1);
  assert(again.items[0].classification == Classification::kUnchanged);

  auto text = batchsync::model::FormatRunSummary(again);
  assert(text.find(again.run_id) != std::string::npos);
  assert(text.find("B3 [unreadable] failed") != std::string::npos);
}

void TestOnlyQualifyingBatchIsTouched() {
  Fixture f;
  WriteFile(f.dir / "source" / "B1" / "a.txt", "0123456789");
  WriteFile(f.dir / "source" / "B2" / "b.txt", "other");

  auto records = MakeRecords({"batchId", "AJ", "AK"}, {{"B1", "PP", ""}, {"B2", "QQ", ""}});

  TransactionLedger ledger(std::make_shared<MemoryLedgerStore>());
  RunCoordinator    coordinator(FastOptions());

  auto summary = coordinator.RunOnce(records, {"AJ", "PP", "AK"}, f.source, f.destination, ledger);
  assert(summary.qualifying == 1);
  assert(summary.completed == 1);
  assert(summary.failed == 0);
  assert(summary.bytes_copied == 10);
  assert(summary.items.size() == 1 && summary.items[0].batch_id == "B1");
  assert(ledger.History("B2").empty());
  assert(!std::filesystem::exists(f.dir / "destination" / "B2"));
}

void TestDryRunWritesNothing() {
  Fixture f;
  f.AddBatch("B1");
  f.AddBatch("B4");

  auto options    = FastOptions();
  options.dry_run = true;

  TransactionLedger ledger(std::make_shared<MemoryLedgerStore>());
  RunCoordinator    coordinator(options);

  auto summary = coordinator.RunOnce(MixedRecords(), kCriteria, f.source, f.destination, ledger);
  assert(summary.skipped == 2);
  assert(summary.failed == 1);
  assert(summary.items[0].outcome.reason == "dry-run");
  assert(ledger.Stats().transactions == 0);
  assert(!std::filesystem::exists(f.dir / "destination" / "B1"));
}

void TestMalformedRecordsAbortBeforeTransfer() {
  Fixture f;
  f.AddBatch("B1");

  TransactionLedger ledger(std::make_shared<MemoryLedgerStore>());
  RunCoordinator    coordinator(FastOptions());

  bool threw = false;
  try {
    (void)coordinator.RunOnce(MakeRecords({"Batch ID", "Status"}, {{"B1", "Ready"}}), kCriteria, f.source, f.destination, ledger);
  } catch (const batchsync::util::MalformedRecordSource&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.Stats().transactions == 0);
  assert(!std::filesystem::exists(f.dir / "destination" / "B1"));
}

void TestLedgerFailureAbortsRun() {
  Fixture f;
  f.AddBatch("B1");
  f.AddBatch("B3");
  f.AddBatch("B4");

  TransactionLedger ledger(std::make_shared<batchsync::testing::FailingLedgerStore>(2));
  RunCoordinator    coordinator(FastOptions());

  bool threw = false;
  try {
    (void)coordinator.RunOnce(MixedRecords(), kCriteria, f.source, f.destination, ledger);
  } catch (const batchsync::util::LedgerWriteError&) {
    threw = true;
  }
  assert(threw);
  assert(coordinator.cancelled());
}

void TestStalePendingIsClosed() {
  Fixture f;
  f.AddBatch("B1");
  f.AddBatch("B2");
  f.AddBatch("B4");

  TransactionLedger ledger(std::make_shared<MemoryLedgerStore>());
  (void)ledger.Begin("old-run", "B2", {});

  RunCoordinator coordinator(FastOptions());
  auto           summary = coordinator.RunOnce(MixedRecords(), kCriteria, f.source, f.destination, ledger);

  auto history = ledger.History("B2");
  assert(history.size() == 2);
  assert(history.back().phase() == PHASE_FAILED);
  assert(history.back().reason() == "abandoned:not-qualifying:" + summary.run_id);
  assert(ledger.PendingIncomplete().empty());
}

void TestSourceOutageSkipsRecopyOnReturn() {
  Fixture f;
  f.AddBatch("B1");
  const auto records = MakeRecords({"Batch ID", "Status", "Archived"}, {{"B1", "Ready", ""}});

  TransactionLedger ledger(std::make_shared<MemoryLedgerStore>());
  RunCoordinator    coordinator(FastOptions());
  assert(coordinator.RunOnce(records, kCriteria, f.source, f.destination, ledger).completed == 1);

  std::filesystem::rename(f.dir / "source" / "B1", f.dir / "B1_offline");
  auto outage = coordinator.RunOnce(records, kCriteria, f.source, f.destination, ledger);
  assert(outage.failed == 1);
  assert(ledger.History("B1").back().reason().rfind("source-unreadable:", 0) == 0);

  std::filesystem::rename(f.dir / "B1_offline", f.dir / "source" / "B1");
  auto back = coordinator.RunOnce(records, kCriteria, f.source, f.destination, ledger);
  assert(back.unchanged_items == 1);
  assert(back.skipped == 1);
  assert(back.files_copied == 0);
  assert(back.AllSucceeded());
}

void TestCancelledCoordinatorStartsNothing() {
  Fixture f;
  f.AddBatch("B1");
  f.AddBatch("B4");

  TransactionLedger ledger(std::make_shared<MemoryLedgerStore>());
  RunCoordinator    coordinator(FastOptions());
  coordinator.Cancel();

  auto summary = coordinator.RunOnce(MixedRecords(), kCriteria, f.source, f.destination, ledger);
  assert(summary.cancelled == 2);
  assert(summary.completed == 0);
  assert(!summary.AllSucceeded());
  assert(ledger.History("B1").empty());
  assert(ledger.History("B4").empty());
}

void TestPoolRunsEveryBatch() {
  Fixture                               f;
  std::vector<std::vector<std::string>> rows;
  for (int i = 0; i < 9; ++i) {
    const auto id = "P" + std::to_string(i);
    f.AddBatch(id, 3);
    rows.push_back({id, "Ready", ""});
  }

  auto options             = FastOptions();
  options.worker_pool_size = 3;

  TransactionLedger ledger(std::make_shared<MemoryLedgerStore>());
  RunCoordinator    coordinator(options);

  auto summary = coordinator.RunOnce(MakeRecords({"Batch ID", "Status", "Archived"}, rows), kCriteria, f.source, f.destination, ledger);
  assert(summary.completed == 9);
  assert(summary.files_copied == 27);
  assert(summary.AllSucceeded());
  assert(ledger.Stats().completed == 9);
  assert(ledger.PendingIncomplete().empty());
}

void TestFormatBytes() {
  assert(batchsync::model::FormatBytes(512) == "512 B");
  assert(batchsync::model::FormatBytes(1536) == "1.5 KB");
  assert(batchsync::model::FormatBytes(3ull * 1024 * 1024) == "3.0 MB");
  assert(batchsync::model::FormatBytes(5ull * 1024 * 1024 * 1024 / 4) == "1.25 GB");
}

} // namespace

int main() {
  TestMixedRunAndRerun();
  TestOnlyQualifyingBatchIsTouched();
  TestDryRunWritesNothing();
  TestMalformedRecordsAbortBeforeTransfer();
  TestLedgerFailureAbortsRun();
  TestStalePendingIsClosed();
  TestSourceOutageSkipsRecopyOnReturn();
  TestCancelledCoordinatorStartsNothing();
  TestPoolRunsEveryBatch();
  TestFormatBytes();

  std::cout << "batchsync_unit_run_coordinator: pass\n";
  return 0;
}
