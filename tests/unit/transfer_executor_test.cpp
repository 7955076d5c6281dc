#include "internal/transfer/transfer_executor.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/ledger/store/memory_ledger_store.hpp"
#include "internal/model/failure_reason.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/transfer/checksum.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using batchsync::ledger::MemoryLedgerStore;
using batchsync::ledger::TransactionLedger;
using batchsync::model::BatchItem;
using batchsync::model::TransferStatus;
using batchsync::storage::StorageLocation;
using batchsync::testing::FlakyBackend;
using batchsync::testing::LocalLocation;
using batchsync::testing::ReadFile;
using batchsync::testing::TempDir;
using batchsync::testing::WriteFile;
using batchsync::transfer::CancellationToken;
using batchsync::transfer::TransferExecutor;
using batchsync::transfer::TransferOptions;
using namespace batchsync::ledger::v1;

TransferOptions FastOptions() {
  TransferOptions options;
  options.max_copy_retries   = 3;
  options.retry_backoff_base = std::chrono::milliseconds(1);
  options.retry_backoff_max  = std::chrono::milliseconds(4);
  options.copy_chunk_bytes   = 3;
  return options;
}

struct Fixture {
  TempDir           dir{"transfer_executor"};
  StorageLocation   source      = LocalLocation(dir / "source");
  StorageLocation   destination = LocalLocation(dir / "destination");
  TransactionLedger ledger{std::make_shared<MemoryLedgerStore>()};

  Fixture() {
    WriteFile(dir / "source" / "B1" / "a.raw", "aaaa");
    WriteFile(dir / "source" / "B1" / "nested" / "b.raw", "bbbbbbbbbb");
  }

  BatchItem Item() const {
    BatchItem item;
    item.batch_id         = "B1";
    item.source_path      = source.PathOf("B1");
    item.destination_path = destination.PathOf("B1");
    item.classification   = batchsync::model::Classification::kNew;
    item.file_manifest    = source.backend->Enumerate(item.source_path);
    return item;
  }

  bool HasStagingFiles() const {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir / "destination")) {
      if (batchsync::storage::common::IsStagingName(entry.path().filename().string())) return true;
    }
    return false;
  }
};

/*
  Cancels the token once a rename onto `target` has gone through.
*/
class CancelAfterRename final : public batchsync::testing::ForwardingBackend {
 public:
  CancelAfterRename(batchsync::storage::StorageBackendPtr inner, std::string target, std::shared_ptr<CancellationToken> token)
      : ForwardingBackend(std::move(inner)), target_(std::move(target)), token_(std::move(token)) {
  }

  void Rename(const std::string& from, const std::string& to) override {
    inner_->Rename(from, to);
    if (batchsync::testing::EndsWith(to, "/" + target_)) token_->Cancel();
  }

 private:
  std::string                        target_;
  std::shared_ptr<CancellationToken> token_;
};

void TestCopiesEveryFileAndCompletes() {
  Fixture          f;
  TransferExecutor executor(f.source.backend, f.destination.backend, FastOptions());

  auto outcome = executor.Execute(f.Item(), f.ledger, "r1");
  assert(outcome.status == TransferStatus::kCompleted);
  assert(outcome.files_copied == 2);
  assert(outcome.bytes_copied == 14);
  assert(ReadFile(f.dir / "destination" / "B1" / "a.raw") == "aaaa");
  assert(ReadFile(f.dir / "destination" / "B1" / "nested" / "b.raw") == "bbbbbbbbbb");
  assert(!f.HasStagingFiles());

  auto history = f.ledger.History("B1");
  assert(history.size() == 5);
  assert(history[0].phase() == PHASE_STARTED);
  assert(history[1].phase() == PHASE_FILE_COPIED);
  assert(history[3].phase() == PHASE_VERIFIED);
  assert(history[4].phase() == PHASE_COMPLETED);
  assert(f.ledger.LatestCompletedManifest("B1")->size() == 2);
}

void TestExecutingCompletedItemAgainIsHarmless() {
  Fixture          f;
  TransferExecutor executor(f.source.backend, f.destination.backend, FastOptions());

  assert(executor.Execute(f.Item(), f.ledger, "r1").status == TransferStatus::kCompleted);
  assert(executor.Execute(f.Item(), f.ledger, "r2").status == TransferStatus::kCompleted);
  assert(ReadFile(f.dir / "destination" / "B1" / "nested" / "b.raw") == "bbbbbbbbbb");
  assert(!f.HasStagingFiles());

  auto history = f.ledger.History("B1");
  assert(history.size() == 10);
  for (size_t i = 0; i < 5; ++i) {
    assert(history[i].run_id() == "r1");
    assert(history[i + 5].run_id() == "r2");
  }
  assert(history[4].phase() == PHASE_COMPLETED);
  assert(history[9].phase() == PHASE_COMPLETED);
}

void TestTransientFailuresAreRetried() {
  Fixture f;
  auto    flaky = std::make_shared<FlakyBackend>(f.destination.backend, "a.raw", 2);

  TransferExecutor executor(f.source.backend, flaky, FastOptions());
  auto             outcome = executor.Execute(f.Item(), f.ledger, "r1");

  assert(outcome.status == TransferStatus::kCompleted);
  assert(flaky->Attempts("a.raw") == 3);
  assert(flaky->Renames("a.raw") == 1);
  assert(!f.HasStagingFiles());

  auto history = f.ledger.History("B1");
  bool seen    = false;
  for (const auto& record : history) {
    if (record.phase() == PHASE_FILE_COPIED && record.relative_path() == "a.raw") {
      seen = record.attempts() == 3;
    }
  }
  assert(seen);
}

void TestExhaustedRetriesFailTheBatch() {
  Fixture f;
  auto    flaky = std::make_shared<FlakyBackend>(f.destination.backend, "a.raw", 4);

  TransferExecutor executor(f.source.backend, flaky, FastOptions());
  auto             outcome = executor.Execute(f.Item(), f.ledger, "r1");

  assert(outcome.status == TransferStatus::kFailed);
  assert(outcome.reason == "copy-error:a.raw");
  assert(outcome.attempts == 3);
  assert(flaky->Attempts("a.raw") == 3);
  assert(!std::filesystem::exists(f.dir / "destination" / "B1" / "a.raw"));
  assert(!f.HasStagingFiles());

  auto history = f.ledger.History("B1");
  assert(history.back().phase() == PHASE_FAILED);
  assert(history.back().reason() == "copy-error:a.raw");
  assert(history.back().attempts() == 3);
  assert(!f.ledger.LatestCompletedManifest("B1"));
}

void TestVerificationMismatchFails() {
  Fixture f;
  auto    lying = std::make_shared<batchsync::testing::MisreportingBackend>(f.destination.backend, "b.raw");

  TransferExecutor executor(f.source.backend, lying, FastOptions());
  auto             outcome = executor.Execute(f.Item(), f.ledger, "r1");

  assert(outcome.status == TransferStatus::kFailed);
  assert(outcome.reason == "verification-mismatch:nested/b.raw");
  assert(f.ledger.History("B1").back().phase() == PHASE_FAILED);
  assert(!f.ledger.LatestCompletedManifest("B1"));
}

void TestChecksumVerificationRecordsDigests() {
  Fixture f;
  auto    options         = FastOptions();
  options.verify_checksum = true;

  TransferExecutor executor(f.source.backend, f.destination.backend, options);
  auto             outcome = executor.Execute(f.Item(), f.ledger, "r1");
  assert(outcome.status == TransferStatus::kCompleted);

  auto manifest = f.ledger.LatestCompletedManifest("B1");
  assert(manifest);
  assert((*manifest)[0].sha256 == batchsync::transfer::Sha256Hex(std::string("aaaa")));
  assert((*manifest)[1].sha256.size() == 64);
}

void TestRetriedRunCopiesOnlyMissingFiles() {
  Fixture f;
  auto    options          = FastOptions();
  options.max_copy_retries = 1;

  auto broken = std::make_shared<FlakyBackend>(f.destination.backend, "b.raw", 100);
  {
    TransferExecutor executor(f.source.backend, broken, options);
    auto             outcome = executor.Execute(f.Item(), f.ledger, "r1");
    assert(outcome.status == TransferStatus::kFailed);
    assert(outcome.files_copied == 1);
  }

  auto counting = std::make_shared<FlakyBackend>(f.destination.backend, "none", 0);
  {
    TransferExecutor executor(f.source.backend, counting, options);
    auto             outcome = executor.Execute(f.Item(), f.ledger, "r2");
    assert(outcome.status == TransferStatus::kCompleted);
    assert(outcome.files_copied == 1);
  }
  assert(counting->Renames("a.raw") == 0);
  assert(counting->Renames("b.raw") == 1);
  assert(f.ledger.History("B1").back().run_id() == "r2");
}

void TestCancelledTransferResumesInPlace() {
  Fixture f;
  auto    token  = std::make_shared<CancellationToken>();
  auto    cancel = std::make_shared<CancelAfterRename>(f.destination.backend, "a.raw", token);
  {
    TransferExecutor executor(f.source.backend, cancel, FastOptions(), token);
    auto             outcome = executor.Execute(f.Item(), f.ledger, "r1");
    assert(outcome.status == TransferStatus::kCancelled);
    assert(outcome.files_copied == 1);
  }

  auto pending = f.ledger.PendingFor("B1");
  assert(pending && pending->run_id == "r1");
  assert(pending->copied.contains("a.raw"));

  auto counting = std::make_shared<FlakyBackend>(f.destination.backend, "none", 0);
  TransferExecutor executor(f.source.backend, counting, FastOptions());
  auto             outcome = executor.Execute(f.Item(), f.ledger, "r2");
  assert(outcome.status == TransferStatus::kCompleted);
  assert(counting->Renames("a.raw") == 0);
  assert(counting->Renames("b.raw") == 1);

  // resumed under its original run id
  auto history = f.ledger.History("B1");
  assert(history.back().run_id() == "r1");
  assert(history.back().phase() == PHASE_COMPLETED);
  assert(f.ledger.PendingIncomplete().empty());
}

void TestChangedManifestSupersedesPendingTransaction() {
  Fixture f;
  auto    stale = f.Item();
  (void)f.ledger.Begin("r1", "B1", stale.file_manifest);

  WriteFile(f.dir / "source" / "B1" / "a.raw", "aaaaaaaa");
  TransferExecutor executor(f.source.backend, f.destination.backend, FastOptions());
  auto             outcome = executor.Execute(f.Item(), f.ledger, "r2");
  assert(outcome.status == TransferStatus::kCompleted);

  auto history = f.ledger.History("B1");
  assert(history[1].run_id() == "r1");
  assert(history[1].phase() == PHASE_FAILED);
  assert(history[1].reason() == "superseded:r2");
  assert(ReadFile(f.dir / "destination" / "B1" / "a.raw") == "aaaaaaaa");
}

void TestCancelledBeforeFirstFile() {
  Fixture f;
  auto    token = std::make_shared<CancellationToken>();
  token->Cancel();

  TransferExecutor executor(f.source.backend, f.destination.backend, FastOptions(), token);
  auto             outcome = executor.Execute(f.Item(), f.ledger, "r1");
  assert(outcome.status == TransferStatus::kCancelled);
  assert(outcome.files_copied == 0);
  assert(!std::filesystem::exists(f.dir / "destination" / "B1" / "a.raw"));
  assert(f.ledger.PendingFor("B1"));
}

void TestSlowCopyTimesOut() {
  Fixture f;
  auto    slow             = std::make_shared<batchsync::testing::SlowBackend>(f.source.backend, std::chrono::milliseconds(30));
  auto    options          = FastOptions();
  options.copy_chunk_bytes = 1;
  options.copy_timeout     = std::chrono::milliseconds(10);
  options.max_copy_retries = 2;

  TransferExecutor executor(slow, f.destination.backend, options);
  auto             outcome = executor.Execute(f.Item(), f.ledger, "r1");
  assert(outcome.status == TransferStatus::kFailed);
  assert(outcome.reason == "copy-error:a.raw");
  assert(outcome.attempts == 2);
  assert(!std::filesystem::exists(f.dir / "destination" / "B1" / "a.raw"));
  assert(!f.HasStagingFiles());
}

void TestSlowFinalReadTimesOut() {
  Fixture f;
  WriteFile(f.dir / "source" / "Z" / "z.raw", "");

  BatchItem item;
  item.batch_id         = "Z";
  item.source_path      = f.source.PathOf("Z");
  item.destination_path = f.destination.PathOf("Z");
  item.file_manifest    = f.source.backend->Enumerate(item.source_path);

  auto slow                = std::make_shared<batchsync::testing::SlowBackend>(f.source.backend, std::chrono::milliseconds(30));
  auto options             = FastOptions();
  options.copy_timeout     = std::chrono::milliseconds(10);
  options.max_copy_retries = 2;

  TransferExecutor executor(slow, f.destination.backend, options);
  auto             outcome = executor.Execute(item, f.ledger, "r1");
  assert(outcome.status == TransferStatus::kFailed);
  assert(outcome.reason == "copy-error:z.raw");
  assert(outcome.attempts == 2);
  assert(!std::filesystem::exists(f.dir / "destination" / "Z" / "z.raw"));
}

void TestPendingResumedWithinMtimeTolerance() {
  Fixture           f;
  TransactionLedger ledger(std::make_shared<MemoryLedgerStore>(), std::chrono::milliseconds(2000));
  auto              options = FastOptions();
  options.mtime_tolerance   = std::chrono::milliseconds(2000);

  auto token  = std::make_shared<CancellationToken>();
  auto cancel = std::make_shared<CancelAfterRename>(f.destination.backend, "a.raw", token);
  {
    TransferExecutor executor(f.source.backend, cancel, options, token);
    assert(executor.Execute(f.Item(), ledger, "r1").status == TransferStatus::kCancelled);
  }

  // a coarse share re-reports the timestamp one second later
  batchsync::testing::ShiftMtime(f.dir / "source" / "B1" / "a.raw", std::chrono::seconds(1));

  auto             counting = std::make_shared<FlakyBackend>(f.destination.backend, "none", 0);
  TransferExecutor executor(f.source.backend, counting, options);
  auto             outcome = executor.Execute(f.Item(), ledger, "r2");
  assert(outcome.status == TransferStatus::kCompleted);
  assert(counting->Renames("a.raw") == 0);
  assert(counting->Renames("b.raw") == 1);

  auto history = ledger.History("B1");
  assert(history.back().run_id() == "r1");
  for (const auto& record : history) {
    assert(record.reason().rfind("superseded:", 0) != 0);
  }
}

void TestVerifiedTransactionRecopiesLostFile() {
  Fixture f;
  auto    item = f.Item();

  // a previous run verified every file but stopped before COMPLETED
  WriteFile(f.dir / "destination" / "B1" / "a.raw", "aaaa");
  WriteFile(f.dir / "destination" / "B1" / "nested" / "b.raw", "bbbbbbbbbb");
  auto handle = f.ledger.Begin("r1", "B1", item.file_manifest);
  f.ledger.RecordFileCopied(handle, "a.raw");
  f.ledger.RecordFileCopied(handle, "nested/b.raw");
  f.ledger.RecordVerified(handle);

  std::filesystem::remove(f.dir / "destination" / "B1" / "nested" / "b.raw");

  auto             counting = std::make_shared<FlakyBackend>(f.destination.backend, "none", 0);
  TransferExecutor executor(f.source.backend, counting, FastOptions());
  auto             outcome = executor.Execute(item, f.ledger, "r2");
  assert(outcome.status == TransferStatus::kCompleted);
  assert(outcome.files_copied == 1);
  assert(counting->Renames("a.raw") == 0);
  assert(counting->Renames("b.raw") == 1);
  assert(ReadFile(f.dir / "destination" / "B1" / "nested" / "b.raw") == "bbbbbbbbbb");

  auto history = f.ledger.History("B1");
  assert(history.size() == 5);
  assert(history[3].phase() == PHASE_VERIFIED);
  assert(history[4].phase() == PHASE_COMPLETED);
  assert(history[4].run_id() == "r1");
}

void TestLedgerFailureEscapes() {
  Fixture           f;
  TransactionLedger ledger(std::make_shared<batchsync::testing::FailingLedgerStore>(1));

  TransferExecutor executor(f.source.backend, f.destination.backend, FastOptions());
  bool             threw = false;
  try {
    (void)executor.Execute(f.Item(), ledger, "r1");
  } catch (const batchsync::util::LedgerWriteError&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyBatchCompletes() {
  Fixture f;
  std::filesystem::create_directories(f.dir / "source" / "EMPTY");

  BatchItem item;
  item.batch_id         = "EMPTY";
  item.source_path      = f.source.PathOf("EMPTY");
  item.destination_path = f.destination.PathOf("EMPTY");

  TransferExecutor executor(f.source.backend, f.destination.backend, FastOptions());
  auto             outcome = executor.Execute(item, f.ledger, "r1");
  assert(outcome.status == TransferStatus::kCompleted);
  assert(outcome.files_copied == 0);
  assert(std::filesystem::is_directory(f.dir / "destination" / "EMPTY"));
}

void TestStagingPathIsHiddenSibling() {
  auto staging = batchsync::transfer::StagingPathFor("/mnt/dest/B1/scan.tif");
  assert(staging.rfind("/mnt/dest/B1/.scan.tif.", 0) == 0);
  assert(batchsync::storage::common::IsStagingName(batchsync::storage::common::BaseName(staging)));
  assert(staging != batchsync::transfer::StagingPathFor("/mnt/dest/B1/scan.tif"));
}

void TestBackoffSchedule() {
  TransferOptions options;
  assert(options.BackoffFor(0).count() == 0);
  assert(options.BackoffFor(1).count() == 500);
  assert(options.BackoffFor(2).count() == 1000);
  assert(options.BackoffFor(8).count() == 60000);
  assert(options.BackoffFor(40).count() == 60000);
}

void TestSha256KnownVector() {
  assert(batchsync::transfer::Sha256Hex(std::string("abc")) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

} // namespace

int main() {
  TestCopiesEveryFileAndCompletes();
  TestExecutingCompletedItemAgainIsHarmless();
  TestTransientFailuresAreRetried();
  TestExhaustedRetriesFailTheBatch();
  TestVerificationMismatchFails();
  TestChecksumVerificationRecordsDigests();
  TestRetriedRunCopiesOnlyMissingFiles();
  TestCancelledTransferResumesInPlace();
  TestChangedManifestSupersedesPendingTransaction();
  TestCancelledBeforeFirstFile();
  TestSlowCopyTimesOut();
  TestSlowFinalReadTimesOut();
  TestPendingResumedWithinMtimeTolerance();
  TestVerifiedTransactionRecopiesLostFile();
  TestLedgerFailureEscapes();
  TestEmptyBatchCompletes();
  TestStagingPathIsHiddenSibling();
  TestBackoffSchedule();
  TestSha256KnownVector();

  std::cout << "batchsync_unit_transfer_executor: pass\n";
  return 0;
}
