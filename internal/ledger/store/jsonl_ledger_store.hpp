#pragma once

#include <arrow/io/file.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/ledger/ledger_store.hpp"

namespace batchsync::ledger {

/*
  One JSON record per line.

  Append:
    - file opened in append mode, one write per record
    - fsync before returning unless disabled

  Replay skips lines that do not decode (a crash mid-append leaves at
  most one torn line at the end). The next append starts on a fresh
  line so a torn tail never swallows a good record.

  ReplaceAll writes a staging file next to the log and renames it over
  the log.
*/
class JsonlLedgerStore final : public LedgerStore {
 public:
  explicit JsonlLedgerStore(std::filesystem::path path, bool fsync = true);
  ~JsonlLedgerStore() override;

  JsonlLedgerStore(const JsonlLedgerStore&)            = delete;
  JsonlLedgerStore& operator=(const JsonlLedgerStore&) = delete;

  void Append(const LedgerRecord& record) override;
  std::vector<LedgerRecord> ReadAll() override;
  void ReplaceAll(const std::vector<LedgerRecord>& records) override;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  void OpenForAppend();
  void CloseStream();
  void WriteDurably(arrow::io::FileOutputStream& out, const std::string& data);
  bool EndsWithNewline() const;

  std::filesystem::path                        path_;
  bool                                         fsync_;
  std::mutex                                   mutex_;
  std::shared_ptr<arrow::io::FileOutputStream> out_;
  bool                                         needs_newline_ = false;
};

} // namespace batchsync::ledger
