#include "transaction_ledger.hpp"

#include <algorithm>

#include "internal/ledger/record_codec.hpp"
#include "internal/model/failure_reason.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace batchsync::ledger {

using namespace batchsync::ledger::v1;
using observability::IntField;
using observability::StringField;

TransactionLedger::TransactionLedger(LedgerStorePtr store, std::chrono::milliseconds mtime_tolerance)
    : store_(std::move(store)), mtime_tolerance_ns_(std::chrono::duration_cast<std::chrono::nanoseconds>(mtime_tolerance).count()) {
  auto records = store_->ReadAll();

  std::unique_lock lock(index_mutex_);
  Rebuild(records);

  BATCHSYNC_LOG_INFO("ledger replayed",
                     {IntField("records", static_cast<int64_t>(log_.size())), IntField("transactions", static_cast<int64_t>(transactions_.size())),
                      IntField("batches", static_cast<int64_t>(batches_.size()))});
}

// ---------------------------------------------------------------------------
// Index
// ---------------------------------------------------------------------------

void TransactionLedger::Rebuild(const std::vector<LedgerRecord>& records) {
  transactions_.clear();
  batches_.clear();
  log_.clear();
  log_.reserve(records.size());

  for (const auto& record : records) {
    if (!Apply(record)) {
      BATCHSYNC_LOG_WARN("ignoring out-of-order ledger record",
                         {StringField("run_id", record.run_id()), StringField("batch_id", record.batch_id()),
                          StringField("phase", model::PhaseName(record.phase()))});
    }
  }
}

bool TransactionLedger::Apply(const LedgerRecord& record) {
  Key  key{record.run_id(), record.batch_id()};
  auto phase = record.phase();

  if (!model::CanTransition(PhaseOf(key), phase)) {
    return false;
  }

  auto ts = util::FromProto(record.timestamp());

  if (phase == PHASE_STARTED) {
    TransactionState state;
    state.key        = key;
    state.manifest   = FromProto(record.manifest());
    state.started_at = ts;
    transactions_.emplace(key, std::move(state));
    batches_[key.batch_id].order.push_back(key);
  }

  auto& state = transactions_.at(key);
  switch (phase) {
    case PHASE_FILE_COPIED:
      state.copied.insert(record.relative_path());
      break;
    case PHASE_COMPLETED:
      state.completed_manifest              = FromProto(record.manifest());
      batches_[key.batch_id].last_completed = key;
      break;
    case PHASE_FAILED:
      state.reason = record.reason();
      break;
    default:
      break;
  }

  state.phase      = phase;
  state.updated_at = ts;
  log_.push_back(record);
  return true;
}

model::Phase TransactionLedger::PhaseOf(const Key& key) const {
  auto it = transactions_.find(key);
  return it == transactions_.end() ? PHASE_UNSPECIFIED : it->second.phase;
}

std::vector<const TransactionLedger::TransactionState*> TransactionLedger::SinceLastCompleted(const std::string& batch_id) const {
  std::vector<const TransactionState*> out;

  auto it = batches_.find(batch_id);
  if (it == batches_.end()) return out;

  const auto& batch = it->second;
  auto        begin = batch.order.begin();
  if (batch.last_completed) {
    begin = std::find_if(batch.order.begin(), batch.order.end(), [&](const Key& k) {
      return k.run_id == batch.last_completed->run_id;
    });
    if (begin != batch.order.end()) ++begin;
  }

  for (auto k = begin; k != batch.order.end(); ++k) {
    out.push_back(&transactions_.at(*k));
  }
  return out;
}

/*
  Files confirmed copied by unfinished transactions since the last
  COMPLETED, keyed by path with the manifest entry they were copied
  from. A verification mismatch means the destination cannot be
  trusted, so everything before it is forgotten.
*/
std::set<std::string> TransactionLedger::CarriedCheckpoints(const std::string& batch_id, const model::Manifest& manifest) const {
  std::map<std::string, model::FileEntry> carried;

  for (const auto* state : SinceLastCompleted(batch_id)) {
    if (state->phase == PHASE_FAILED && model::HasReasonPrefix(state->reason, model::kVerificationMismatch)) {
      carried.clear();
      continue;
    }
    for (const auto& path : state->copied) {
      if (auto entry = model::FindEntry(state->manifest, path)) {
        carried[path] = *entry;
      }
    }
  }

  std::set<std::string> out;
  for (const auto& [path, entry] : carried) {
    auto current = model::FindEntry(manifest, path);
    if (current && model::SameFile(*current, entry, mtime_tolerance_ns_)) {
      out.insert(path);
    }
  }
  return out;
}

PendingTransaction TransactionLedger::ToPending(const TransactionState& state) {
  PendingTransaction pending;
  pending.run_id     = state.key.run_id;
  pending.batch_id   = state.key.batch_id;
  pending.phase      = state.phase;
  pending.manifest   = state.manifest;
  pending.copied     = state.copied;
  pending.started_at = state.started_at;
  return pending;
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

std::mutex& TransactionLedger::BatchMutex(const std::string& batch_id) {
  std::lock_guard lock(batch_mutexes_guard_);
  auto&           slot = batch_mutexes_[batch_id];
  if (!slot) slot = std::make_unique<std::mutex>();
  return *slot;
}

LedgerRecord TransactionLedger::MakeRecord(const Key& key, model::Phase phase) const {
  LedgerRecord record;
  record.set_run_id(key.run_id);
  record.set_batch_id(key.batch_id);
  record.set_phase(phase);
  *record.mutable_timestamp() = util::ToProto(util::Now());
  return record;
}

void TransactionLedger::AppendAndApply(const LedgerRecord& record) {
  try {
    store_->Append(record);
  } catch (const util::LedgerWriteError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::LedgerWriteError(e.what());
  }

  std::unique_lock lock(index_mutex_);
  Apply(record);
}

void TransactionLedger::Transition(const Key& key, model::Phase to, LedgerRecord record) {
  std::lock_guard batch_lock(BatchMutex(key.batch_id));
  {
    std::shared_lock lock(index_mutex_);
    auto             from = PhaseOf(key);
    if (!model::CanTransition(from, to)) {
      throw util::InvalidState("invalid ledger transition " + std::string(model::PhaseName(from)) + " -> " + model::PhaseName(to) + " for run " +
                               key.run_id + " batch " + key.batch_id);
    }
  }
  AppendAndApply(record);
}

TransactionHandle TransactionLedger::Begin(const std::string& run_id, const std::string& batch_id, const model::Manifest& manifest) {
  Key key{run_id, batch_id};

  TransactionHandle handle;
  handle.run_id_   = run_id;
  handle.batch_id_ = batch_id;
  handle.manifest_ = manifest;
  model::SortManifest(handle.manifest_);
  {
    std::shared_lock lock(index_mutex_);
    handle.checkpoints_ = CarriedCheckpoints(batch_id, handle.manifest_);
  }

  auto record                = MakeRecord(key, PHASE_STARTED);
  *record.mutable_manifest() = ToProto(handle.manifest_);
  Transition(key, PHASE_STARTED, std::move(record));
  handle.phase_ = PHASE_STARTED;

  BATCHSYNC_LOG_INFO("transaction started", {StringField("run_id", run_id), StringField("batch_id", batch_id),
                                             IntField("files", static_cast<int64_t>(handle.manifest_.size())),
                                             IntField("carried", static_cast<int64_t>(handle.checkpoints_.size()))});
  return handle;
}

std::optional<TransactionHandle> TransactionLedger::Resume(const std::string& run_id, const std::string& batch_id) {
  std::shared_lock lock(index_mutex_);

  auto it = transactions_.find(Key{run_id, batch_id});
  if (it == transactions_.end() || model::IsTerminal(it->second.phase)) {
    return std::nullopt;
  }

  const auto&       state = it->second;
  TransactionHandle handle;
  handle.run_id_      = run_id;
  handle.batch_id_    = batch_id;
  handle.manifest_    = state.manifest;
  handle.checkpoints_ = CarriedCheckpoints(batch_id, state.manifest);
  handle.checkpoints_.insert(state.copied.begin(), state.copied.end());
  handle.resumed_ = true;
  handle.phase_   = state.phase;

  BATCHSYNC_LOG_INFO("transaction resumed", {StringField("run_id", run_id), StringField("batch_id", batch_id),
                                             StringField("phase", model::PhaseName(state.phase)),
                                             IntField("checkpoints", static_cast<int64_t>(handle.checkpoints_.size()))});
  return handle;
}

void TransactionLedger::RecordFileCopied(TransactionHandle& handle, const std::string& relative_path, uint32_t attempts) {
  if (!model::FindEntry(handle.manifest_, relative_path)) {
    throw util::InvalidState("file not in transaction manifest: " + relative_path);
  }

  Key  key{handle.run_id_, handle.batch_id_};
  auto record = MakeRecord(key, PHASE_FILE_COPIED);
  record.set_relative_path(relative_path);
  record.set_attempts(attempts);
  Transition(key, PHASE_FILE_COPIED, std::move(record));

  handle.checkpoints_.insert(relative_path);
  handle.phase_ = PHASE_FILE_COPIED;

  BATCHSYNC_LOG_DEBUG("file copied", {StringField("run_id", key.run_id), StringField("batch_id", key.batch_id),
                                      StringField("path", relative_path), IntField("attempts", attempts)});
}

void TransactionLedger::RecordVerified(TransactionHandle& handle) {
  Key key{handle.run_id_, handle.batch_id_};
  Transition(key, PHASE_VERIFIED, MakeRecord(key, PHASE_VERIFIED));
  handle.phase_ = PHASE_VERIFIED;

  BATCHSYNC_LOG_INFO("transaction verified", {StringField("run_id", key.run_id), StringField("batch_id", key.batch_id)});
}

void TransactionLedger::RecordCompleted(TransactionHandle& handle, const model::Manifest& manifest) {
  Key  key{handle.run_id_, handle.batch_id_};
  auto record                = MakeRecord(key, PHASE_COMPLETED);
  *record.mutable_manifest() = ToProto(manifest);
  Transition(key, PHASE_COMPLETED, std::move(record));
  handle.phase_ = PHASE_COMPLETED;

  BATCHSYNC_LOG_INFO("transaction completed", {StringField("run_id", key.run_id), StringField("batch_id", key.batch_id),
                                               IntField("files", static_cast<int64_t>(manifest.size())),
                                               IntField("bytes", static_cast<int64_t>(model::TotalBytes(manifest)))});
}

void TransactionLedger::RecordFailed(TransactionHandle& handle, const std::string& reason, uint32_t attempts) {
  Key  key{handle.run_id_, handle.batch_id_};
  auto record = MakeRecord(key, PHASE_FAILED);
  record.set_reason(reason);
  record.set_attempts(attempts);
  Transition(key, PHASE_FAILED, std::move(record));
  handle.phase_ = PHASE_FAILED;

  BATCHSYNC_LOG_WARN("transaction failed", {StringField("run_id", key.run_id), StringField("batch_id", key.batch_id), StringField("reason", reason),
                                            IntField("attempts", attempts)});
}

void TransactionLedger::FailPending(const std::string& run_id, const std::string& batch_id, const std::string& reason) {
  Key  key{run_id, batch_id};
  auto record = MakeRecord(key, PHASE_FAILED);
  record.set_reason(reason);
  Transition(key, PHASE_FAILED, std::move(record));

  BATCHSYNC_LOG_WARN("pending transaction closed", {StringField("run_id", run_id), StringField("batch_id", batch_id), StringField("reason", reason)});
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<model::Manifest> TransactionLedger::LatestCompletedManifest(const std::string& batch_id) const {
  std::shared_lock lock(index_mutex_);

  auto it = batches_.find(batch_id);
  if (it == batches_.end() || !it->second.last_completed) return std::nullopt;
  return transactions_.at(*it->second.last_completed).completed_manifest;
}

std::vector<PendingTransaction> TransactionLedger::PendingIncomplete() const {
  std::shared_lock lock(index_mutex_);

  std::vector<PendingTransaction> out;
  for (const auto& [key, state] : transactions_) {
    if (!model::IsTerminal(state.phase)) {
      out.push_back(ToPending(state));
    }
  }
  std::sort(out.begin(), out.end(), [](const PendingTransaction& a, const PendingTransaction& b) {
    if (a.started_at != b.started_at) return a.started_at < b.started_at;
    return a.batch_id < b.batch_id;
  });
  return out;
}

std::optional<PendingTransaction> TransactionLedger::PendingFor(const std::string& batch_id) const {
  std::shared_lock lock(index_mutex_);

  auto since = SinceLastCompleted(batch_id);
  for (auto it = since.rbegin(); it != since.rend(); ++it) {
    if (!model::IsTerminal((*it)->phase)) return ToPending(**it);
  }
  return std::nullopt;
}

std::optional<model::Phase> TransactionLedger::LatestPhaseSinceCompleted(const std::string& batch_id) const {
  std::shared_lock lock(index_mutex_);

  auto since = SinceLastCompleted(batch_id);
  if (since.empty()) return std::nullopt;
  return since.back()->phase;
}

bool TransactionLedger::DestinationTouchedSinceCompleted(const std::string& batch_id) const {
  std::shared_lock lock(index_mutex_);

  for (const auto* state : SinceLastCompleted(batch_id)) {
    if (!model::IsTerminal(state->phase) || !state->copied.empty()) return true;
    if (model::HasReasonPrefix(state->reason, model::kCopyError) || model::HasReasonPrefix(state->reason, model::kVerificationMismatch) ||
        model::HasReasonPrefix(state->reason, model::kUnexpectedError)) {
      return true;
    }
  }
  return false;
}

std::vector<LedgerRecord> TransactionLedger::History(const std::string& batch_id) const {
  std::shared_lock lock(index_mutex_);

  std::vector<LedgerRecord> out;
  for (const auto& record : log_) {
    if (record.batch_id() == batch_id) out.push_back(record);
  }
  return out;
}

std::vector<std::string> TransactionLedger::Batches() const {
  std::shared_lock lock(index_mutex_);

  std::vector<std::string> out;
  out.reserve(batches_.size());
  for (const auto& [batch_id, _] : batches_) {
    out.push_back(batch_id);
  }
  return out;
}

LedgerStats TransactionLedger::Stats() const {
  std::shared_lock lock(index_mutex_);

  LedgerStats stats;
  stats.transactions = transactions_.size();
  stats.batches      = batches_.size();

  for (const auto& [key, state] : transactions_) {
    switch (state.phase) {
      case PHASE_COMPLETED:
        ++stats.completed;
        stats.bytes_replicated += model::TotalBytes(state.completed_manifest);
        break;
      case PHASE_FAILED:
        ++stats.failed;
        break;
      default:
        ++stats.pending;
        break;
    }
  }

  for (const auto& record : log_) {
    if (record.phase() == PHASE_FILE_COPIED) ++stats.files_copied;

    auto ts = util::FromProto(record.timestamp());
    if (!stats.last_record || ts > *stats.last_record) stats.last_record = ts;
  }
  return stats;
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

uint64_t TransactionLedger::Compact(std::chrono::hours retention, util::TimePoint now) {
  std::unique_lock lock(index_mutex_);

  const auto cutoff = now - retention;

  std::set<Key> keep;
  for (const auto& [batch_id, batch] : batches_) {
    bool protect = false;
    if (batch.last_completed) {
      keep.insert(*batch.last_completed);
    } else if (!batch.order.empty()) {
      // without a completion, the newest transaction still drives classification
      keep.insert(batch.order.back());
    }

    for (const auto& key : batch.order) {
      const auto& state = transactions_.at(key);
      if (batch.last_completed && key.run_id == batch.last_completed->run_id) {
        protect = true;
        continue;
      }
      if (protect || !model::IsTerminal(state.phase) || state.updated_at >= cutoff) {
        keep.insert(key);
      }
    }
  }

  const auto before = transactions_.size();
  if (keep.size() == before) return 0;

  std::vector<LedgerRecord> kept;
  kept.reserve(log_.size());
  for (const auto& record : log_) {
    if (keep.contains(Key{record.run_id(), record.batch_id()})) kept.push_back(record);
  }

  store_->ReplaceAll(kept);
  Rebuild(kept);

  const uint64_t removed = before - transactions_.size();
  BATCHSYNC_LOG_INFO("ledger compacted", {IntField("removed_transactions", static_cast<int64_t>(removed)),
                                          IntField("remaining_records", static_cast<int64_t>(log_.size()))});
  return removed;
}

} // namespace batchsync::ledger
