#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/ledger/ledger_store.hpp"
#include "internal/model/manifest.hpp"
#include "internal/model/transaction_phase.hpp"
#include "internal/util/time.hpp"

namespace batchsync::ledger {

/*
  Write capability for one (run, batch) transaction.

  Checkpoints are files already confirmed at the destination: the
  transaction's own FILE_COPIED records plus files carried over from
  earlier unfinished transactions of the same batch whose manifest
  entry is unchanged.
*/
class TransactionHandle {
 public:
  const std::string& run_id() const {
    return run_id_;
  }
  const std::string& batch_id() const {
    return batch_id_;
  }
  const model::Manifest& manifest() const {
    return manifest_;
  }
  const std::set<std::string>& checkpoints() const {
    return checkpoints_;
  }
  bool IsCheckpointed(const std::string& relative_path) const {
    return checkpoints_.contains(relative_path);
  }
  bool resumed() const {
    return resumed_;
  }
  // Last phase written through this handle (or found on resume).
  model::Phase phase() const {
    return phase_;
  }

 private:
  friend class TransactionLedger;

  std::string           run_id_;
  std::string           batch_id_;
  model::Manifest       manifest_;
  std::set<std::string> checkpoints_;
  bool                  resumed_ = false;
  model::Phase          phase_   = batchsync::ledger::v1::PHASE_UNSPECIFIED;
};

// A transaction whose last record is STARTED, FILE_COPIED or VERIFIED.
struct PendingTransaction {
  std::string           run_id;
  std::string           batch_id;
  model::Phase          phase = batchsync::ledger::v1::PHASE_UNSPECIFIED;
  model::Manifest       manifest;
  std::set<std::string> copied;
  util::TimePoint       started_at;
};

struct LedgerStats {
  uint64_t transactions     = 0;
  uint64_t completed        = 0;
  uint64_t failed           = 0;
  uint64_t pending          = 0;
  uint64_t batches          = 0;
  uint64_t files_copied     = 0;
  uint64_t bytes_replicated = 0;

  std::optional<util::TimePoint> last_record;
};

/*
  Append-only, crash-recoverable transfer ledger.

  Construction replays the store into an in-memory index; every write
  goes to the store first and only then into the index, so the index
  never runs ahead of what is durable.

  Transitions per (run, batch) are validated with model::CanTransition.
  An out-of-order request throws util::InvalidState and writes nothing.
  A store failure throws util::LedgerWriteError.

  Writes for one batch are serialized by a per-batch mutex; different
  batches only share the store's own append lock.
*/
class TransactionLedger {
 public:
  // mtime_tolerance applies when carrying checkpoints into a new transaction.
  explicit TransactionLedger(LedgerStorePtr store, std::chrono::milliseconds mtime_tolerance = std::chrono::milliseconds(0));

  TransactionLedger(const TransactionLedger&)            = delete;
  TransactionLedger& operator=(const TransactionLedger&) = delete;

  // ------------------------------------------------------------------
  // Transitions
  // ------------------------------------------------------------------
  TransactionHandle Begin(const std::string& run_id, const std::string& batch_id, const model::Manifest& manifest);

  /*
    Reopen a pending transaction. nullopt if (run, batch) is unknown
    or already terminal.
  */
  std::optional<TransactionHandle> Resume(const std::string& run_id, const std::string& batch_id);

  void RecordFileCopied(TransactionHandle& handle, const std::string& relative_path, uint32_t attempts = 1);
  void RecordVerified(TransactionHandle& handle);
  void RecordCompleted(TransactionHandle& handle, const model::Manifest& manifest);
  void RecordFailed(TransactionHandle& handle, const std::string& reason, uint32_t attempts = 0);

  // Close a pending transaction without holding its handle.
  void FailPending(const std::string& run_id, const std::string& batch_id, const std::string& reason);

  // ------------------------------------------------------------------
  // Queries
  // ------------------------------------------------------------------
  std::optional<model::Manifest> LatestCompletedManifest(const std::string& batch_id) const;

  std::vector<PendingTransaction> PendingIncomplete() const;

  // Most recent pending transaction of a batch after its last COMPLETED.
  std::optional<PendingTransaction> PendingFor(const std::string& batch_id) const;

  // Last phase of the most recent transaction after the batch's last COMPLETED.
  std::optional<model::Phase> LatestPhaseSinceCompleted(const std::string& batch_id) const;

  /*
    True if a transaction after the batch's last COMPLETED may have
    written to its destination: it is still pending, it copied files,
    or it failed while copying or verifying. Transactions that closed
    before touching the destination (source-unreadable, abandoned or
    superseded without copies) do not count.
  */
  bool DestinationTouchedSinceCompleted(const std::string& batch_id) const;

  std::vector<LedgerRecord> History(const std::string& batch_id) const;

  std::vector<std::string> Batches() const;

  LedgerStats Stats() const;

  // ------------------------------------------------------------------
  // Maintenance (offline only, never during a run)
  // ------------------------------------------------------------------
  /*
    Drop terminal transactions whose last record is older than
    retention. A batch always keeps its latest COMPLETED transaction,
    everything after it, and every pending transaction.

    Returns the number of transactions removed.
  */
  uint64_t Compact(std::chrono::hours retention, util::TimePoint now = util::Now());

 private:
  struct Key {
    std::string run_id;
    std::string batch_id;

    bool operator<(const Key& o) const {
      return run_id != o.run_id ? run_id < o.run_id : batch_id < o.batch_id;
    }
  };

  struct TransactionState {
    Key                   key;
    model::Phase          phase = batchsync::ledger::v1::PHASE_UNSPECIFIED;
    model::Manifest       manifest; // from STARTED
    model::Manifest       completed_manifest;
    std::set<std::string> copied;
    std::string           reason;
    util::TimePoint       started_at;
    util::TimePoint       updated_at;
  };

  struct BatchState {
    std::vector<Key>   order; // by STARTED
    std::optional<Key> last_completed;
  };

  // Callers hold index_mutex_ exclusively.
  void Rebuild(const std::vector<LedgerRecord>& records);
  bool Apply(const LedgerRecord& record);

  LedgerRecord MakeRecord(const Key& key, model::Phase phase) const;
  void         AppendAndApply(const LedgerRecord& record);
  void         Transition(const Key& key, model::Phase to, LedgerRecord record);

  std::mutex& BatchMutex(const std::string& batch_id);

  // Callers hold index_mutex_.
  model::Phase                         PhaseOf(const Key& key) const;
  std::vector<const TransactionState*> SinceLastCompleted(const std::string& batch_id) const;
  std::set<std::string>                CarriedCheckpoints(const std::string& batch_id, const model::Manifest& manifest) const;
  static PendingTransaction            ToPending(const TransactionState& state);

  LedgerStorePtr store_;
  int64_t        mtime_tolerance_ns_ = 0;

  mutable std::shared_mutex         index_mutex_;
  std::map<Key, TransactionState>   transactions_;
  std::map<std::string, BatchState> batches_;
  std::vector<LedgerRecord>         log_;

  std::mutex                                          batch_mutexes_guard_;
  std::map<std::string, std::unique_ptr<std::mutex>> batch_mutexes_;
};

} // namespace batchsync::ledger
