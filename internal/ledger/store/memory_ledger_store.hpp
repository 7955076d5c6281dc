#pragma once

#include <mutex>
#include <vector>

#include "internal/ledger/ledger_store.hpp"

namespace batchsync::ledger {

/*
  Process-local store. Used by dry runs and tests.
*/
class MemoryLedgerStore final : public LedgerStore {
 public:
  void Append(const LedgerRecord& record) override;
  std::vector<LedgerRecord> ReadAll() override;
  void ReplaceAll(const std::vector<LedgerRecord>& records) override;

 private:
  std::mutex                mutex_;
  std::vector<LedgerRecord> records_;
};

} // namespace batchsync::ledger
