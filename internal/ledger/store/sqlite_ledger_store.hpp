#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/ledger/ledger_store.hpp"

namespace batchsync::ledger {

/*
  Append-only ledger_records table:

      seq INTEGER PRIMARY KEY AUTOINCREMENT
      run_id, batch_id, phase   (for ad-hoc queries)
      record_json               (authoritative record)

  Replay reads in seq order.
*/
class SqliteLedgerStore final : public LedgerStore {
 public:
  explicit SqliteLedgerStore(const std::string& path);

  void Append(const LedgerRecord& record) override;
  std::vector<LedgerRecord> ReadAll() override;
  void ReplaceAll(const std::vector<LedgerRecord>& records) override;

 private:
  void Insert(const LedgerRecord& record);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::mutex                            mutex_;
};

} // namespace batchsync::ledger
