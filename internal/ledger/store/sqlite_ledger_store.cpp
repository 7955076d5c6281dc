#include "sqlite_ledger_store.hpp"

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/ledger/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace batchsync::ledger {

using db::sqlite::SqliteDB;
using db::sqlite::SqliteTransaction;
using db::sqlite::Statement;

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS ledger_records ("
    "  seq         INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  run_id      TEXT    NOT NULL,"
    "  batch_id    TEXT    NOT NULL,"
    "  phase       INTEGER NOT NULL,"
    "  record_json TEXT    NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS ledger_records_batch ON ledger_records(batch_id, seq);";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

} // namespace

SqliteLedgerStore::SqliteLedgerStore(const std::string& path) {
  try {
    db_ = std::make_shared<SqliteDB>(path);
    db_->Exec(kSchema);
  } catch (const std::exception& e) {
    throw util::LedgerWriteError("cannot open ledger " + path + ": " + e.what());
  }
}

void SqliteLedgerStore::Append(const LedgerRecord& record) {
  std::lock_guard lock(mutex_);
  try {
    Insert(record);
  } catch (const std::exception& e) {
    throw util::LedgerWriteError("ledger append failed (" + db_->path() + "): " + e.what());
  }
}

std::vector<LedgerRecord> SqliteLedgerStore::ReadAll() {
  std::lock_guard lock(mutex_);

  std::vector<LedgerRecord> records;
  Statement                 st(*db_, "SELECT seq, record_json FROM ledger_records ORDER BY seq;");

  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto record = DecodeJson(ColText(st.get(), 1));
    if (!record) {
      BATCHSYNC_LOG_WARN("skipping unreadable ledger row",
                         {observability::StringField("path", db_->path()), observability::IntField("seq", sqlite3_column_int64(st.get(), 0))});
      continue;
    }
    records.push_back(std::move(*record));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("ledger read failed: ") + sqlite3_errmsg(db_->Handle()));
  }
  return records;
}

void SqliteLedgerStore::ReplaceAll(const std::vector<LedgerRecord>& records) {
  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(db_);
    db_->Exec("DELETE FROM ledger_records;");
    for (const auto& record : records) {
      Insert(record);
    }
    tx.Commit();
  } catch (const std::exception& e) {
    throw util::LedgerWriteError("ledger rewrite failed (" + db_->path() + "): " + e.what());
  }
}

void SqliteLedgerStore::Insert(const LedgerRecord& record) {
  Statement st(*db_, "INSERT INTO ledger_records(run_id,batch_id,phase,record_json) VALUES(?,?,?,?);");

  BindText(st.get(), 1, record.run_id());
  BindText(st.get(), 2, record.batch_id());
  sqlite3_bind_int(st.get(), 3, static_cast<int>(record.phase()));
  BindText(st.get(), 4, EncodeJson(record));

  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    throw std::runtime_error(sqlite3_errmsg(db_->Handle()));
  }
}

} // namespace batchsync::ledger
