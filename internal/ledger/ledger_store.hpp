#pragma once

#include <memory>
#include <vector>

#include "batchsync/ledger/v1/ledger.pb.h"

namespace batchsync::ledger {

using LedgerRecord = batchsync::ledger::v1::TransactionRecord;

/*
  Durable record log behind the TransactionLedger.

  Contract:
    - Append is durable when it returns; failure throws
      util::LedgerWriteError
    - ReadAll returns records in append order
    - ReplaceAll swaps the whole log atomically (offline compaction)

  Implementations must be safe to call from several threads.
*/
class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  virtual void Append(const LedgerRecord& record) = 0;

  virtual std::vector<LedgerRecord> ReadAll() = 0;

  virtual void ReplaceAll(const std::vector<LedgerRecord>& records) = 0;
};

using LedgerStorePtr = std::shared_ptr<LedgerStore>;

} // namespace batchsync::ledger
