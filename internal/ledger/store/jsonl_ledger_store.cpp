#include "jsonl_ledger_store.hpp"

#include <arrow/io/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "internal/ledger/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace batchsync::ledger {

using storage::common::Unwrap;

JsonlLedgerStore::JsonlLedgerStore(std::filesystem::path path, bool fsync) : path_(std::move(path)), fsync_(fsync) {
  try {
    if (path_.has_parent_path()) {
      std::filesystem::create_directories(path_.parent_path());
    }
    needs_newline_ = !EndsWithNewline();
    OpenForAppend();
  } catch (const std::exception& e) {
    throw util::LedgerWriteError("cannot open ledger " + path_.string() + ": " + e.what());
  }
}

JsonlLedgerStore::~JsonlLedgerStore() {
  try {
    CloseStream();
  } catch (const std::exception& e) {
    BATCHSYNC_LOG_WARN("ledger close failed", {observability::StringField("path", path_.string()), observability::StringField("error", e.what())});
  }
}

void JsonlLedgerStore::Append(const LedgerRecord& record) {
  std::string line = EncodeJson(record);
  line.push_back('\n');

  std::lock_guard lock(mutex_);
  try {
    if (!out_) OpenForAppend();
    if (needs_newline_) {
      line.insert(line.begin(), '\n');
    }
    WriteDurably(*out_, line);
    needs_newline_ = false;
  } catch (const std::exception& e) {
    // the stream may be in an unknown position; reopen on next append
    out_.reset();
    needs_newline_ = true;
    throw util::LedgerWriteError("ledger append failed (" + path_.string() + "): " + e.what());
  }
}

std::vector<LedgerRecord> JsonlLedgerStore::ReadAll() {
  std::lock_guard lock(mutex_);

  std::vector<LedgerRecord> records;
  if (!std::filesystem::exists(path_)) return records;

  auto        file    = Unwrap(arrow::io::ReadableFile::Open(path_.string()));
  std::string content = storage::common::ReadAll(file);
  Unwrap(file->Close());

  std::istringstream in(content);
  std::string        line;
  uint64_t           line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;

    auto record = DecodeJson(line);
    if (!record) {
      BATCHSYNC_LOG_WARN("skipping unreadable ledger line",
                         {observability::StringField("path", path_.string()), observability::IntField("line", static_cast<int64_t>(line_no))});
      continue;
    }
    records.push_back(std::move(*record));
  }
  return records;
}

void JsonlLedgerStore::ReplaceAll(const std::vector<LedgerRecord>& records) {
  std::lock_guard lock(mutex_);

  auto staging = path_;
  staging += ".compact.tmp";

  try {
    std::string content;
    for (const auto& record : records) {
      content += EncodeJson(record);
      content.push_back('\n');
    }

    auto out = Unwrap(arrow::io::FileOutputStream::Open(staging.string(), /*append=*/false));
    WriteDurably(*out, content);
    Unwrap(out->Close());

    CloseStream();
    std::filesystem::rename(staging, path_);
    needs_newline_ = false;
    OpenForAppend();
  } catch (const std::exception& e) {
    std::error_code ec;
    std::filesystem::remove(staging, ec);
    throw util::LedgerWriteError("ledger rewrite failed (" + path_.string() + "): " + e.what());
  }
}

void JsonlLedgerStore::OpenForAppend() {
  out_ = Unwrap(arrow::io::FileOutputStream::Open(path_.string(), /*append=*/true));
}

void JsonlLedgerStore::CloseStream() {
  if (!out_) return;
  auto stream = std::move(out_);
  Unwrap(stream->Close());
}

void JsonlLedgerStore::WriteDurably(arrow::io::FileOutputStream& out, const std::string& data) {
  Unwrap(out.Write(data.data(), static_cast<int64_t>(data.size())));
  if (!fsync_) return;
  if (::fsync(out.file_descriptor()) != 0) {
    throw std::runtime_error(std::string("fsync: ") + std::strerror(errno));
  }
}

bool JsonlLedgerStore::EndsWithNewline() const {
  std::error_code ec;
  auto            size = std::filesystem::file_size(path_, ec);
  if (ec || size == 0) return true;

  auto file = Unwrap(arrow::io::ReadableFile::Open(path_.string()));
  auto last = Unwrap(file->ReadAt(static_cast<int64_t>(size) - 1, 1));
  Unwrap(file->Close());
  return last->size() == 1 && last->data()[0] == '\n';
}

} // namespace batchsync::ledger
