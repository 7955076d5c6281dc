#pragma once

#include <sqlite3.h>

#include <string>

namespace batchsync::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize, or use Statement)
  sqlite3_stmt* Prepare(const std::string& sql);

  // WAL, full fsync on commit, busy timeout
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Owns a prepared statement for the scope it lives in.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql) : stmt_(db.Prepare(sql)) {
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_;
};

} // namespace batchsync::db::sqlite
