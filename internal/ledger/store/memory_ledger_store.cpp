#include "memory_ledger_store.hpp"

namespace batchsync::ledger {

void MemoryLedgerStore::Append(const LedgerRecord& record) {
  std::lock_guard lock(mutex_);
  records_.push_back(record);
}

std::vector<LedgerRecord> MemoryLedgerStore::ReadAll() {
  std::lock_guard lock(mutex_);
  return records_;
}

void MemoryLedgerStore::ReplaceAll(const std::vector<LedgerRecord>& records) {
  std::lock_guard lock(mutex_);
  records_ = records;
}

} // namespace batchsync::ledger
