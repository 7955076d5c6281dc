#include "csv_record_source.hpp"

#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <arrow/scalar.h>
#include <arrow/table.h>

#include <algorithm>
#include <filesystem>
#include <thread>
#include <unordered_map>

#include "internal/filter/record_filter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace batchsync::source {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::chrono::milliseconds kMaxOpenRetryDelay{60000};

std::string CellText(const arrow::ChunkedArray& column, int64_t row) {
  auto scalar = column.GetScalar(row);
  if (!scalar.ok() || !(*scalar)->is_valid) return "";

  const auto& value = *scalar;
  if (value->type->id() == arrow::Type::STRING) {
    return std::static_pointer_cast<arrow::StringScalar>(value)->value->ToString();
  }
  return value->ToString();
}

} // namespace

const std::vector<std::string>& DefaultBatchIdColumns() {
  static const std::vector<std::string> columns = {"Batch ID", "BatchID", "Batch_ID", "ID", "Batch Number"};
  return columns;
}

CsvRecordSource::CsvRecordSource(CsvOptions options) : options_(std::move(options)) {
}

model::RecordSet CsvRecordSource::LoadRecords() {
  auto records = Parse(OpenWithRetry(), options_);
  BATCHSYNC_LOG_INFO("records loaded", {StringField("path", options_.path), IntField("rows", static_cast<int64_t>(records.rows.size())),
                                        IntField("columns", static_cast<int64_t>(records.columns.size()))});
  return records;
}

/*
  Spreadsheets exported to shared drives are often held open by
  another user; opening is retried with a doubling delay.
*/
std::shared_ptr<arrow::io::InputStream> CsvRecordSource::OpenWithRetry() {
  if (!std::filesystem::exists(options_.path)) {
    throw util::MalformedRecordSource("record source not found: " + options_.path);
  }

  auto     delay    = options_.open_retry_delay;
  uint32_t attempts = std::max<uint32_t>(options_.open_attempts, 1);
  for (uint32_t attempt = 1;; ++attempt) {
    auto file = arrow::io::ReadableFile::Open(options_.path);
    if (file.ok()) return *file;

    if (attempt >= attempts) {
      throw util::MalformedRecordSource("cannot open record source " + options_.path + ": " + file.status().ToString());
    }

    BATCHSYNC_LOG_WARN("record source busy, retrying", {StringField("path", options_.path), IntField("attempt", attempt),
                                                        IntField("delay_ms", delay.count()), StringField("error", file.status().ToString())});
    std::this_thread::sleep_for(delay);
    delay = std::min(delay * 2, kMaxOpenRetryDelay);
  }
}

model::RecordSet CsvRecordSource::Parse(std::shared_ptr<arrow::io::InputStream> input, const CsvOptions& options) {
  auto read_options    = arrow::csv::ReadOptions::Defaults();
  auto parse_options   = arrow::csv::ParseOptions::Defaults();
  auto convert_options = arrow::csv::ConvertOptions::Defaults();

  read_options.use_threads         = false;
  parse_options.delimiter          = options.delimiter;
  parse_options.quoting            = true;
  parse_options.newlines_in_values = true;

  const auto& id_candidates = options.batch_id_columns.empty() ? DefaultBatchIdColumns() : options.batch_id_columns;
  for (const auto& name : id_candidates) {
    convert_options.column_types[name] = arrow::utf8();
  }
  for (const auto& name : options.text_columns) {
    convert_options.column_types[name] = arrow::utf8();
  }
  convert_options.strings_can_be_null = false;

  auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), std::move(input), read_options, parse_options, convert_options);
  if (!reader.ok()) {
    throw util::MalformedRecordSource("cannot read record source " + options.path + ": " + reader.status().ToString());
  }
  auto table = (*reader)->Read();
  if (!table.ok()) {
    throw util::MalformedRecordSource("cannot parse record source " + options.path + ": " + table.status().ToString());
  }

  model::RecordSet records;
  records.columns = (*table)->schema()->field_names();

  auto id_column = std::find_if(id_candidates.begin(), id_candidates.end(), [&](const std::string& name) {
    return records.HasColumn(name);
  });
  if (id_column == id_candidates.end()) {
    throw util::MalformedRecordSource("record source " + options.path + " has no batch id column");
  }

  const auto& t        = **table;
  const int   id_index = t.schema()->GetFieldIndex(*id_column);
  if (id_index < 0) {
    throw util::MalformedRecordSource("record source " + options.path + " has a duplicated column " + *id_column);
  }
  for (int64_t row = 0; row < t.num_rows(); ++row) {
    std::string batch_id(filter::Trim(CellText(*t.column(id_index), row)));
    if (batch_id.empty()) {
      BATCHSYNC_LOG_WARN("skipping row without batch id", {StringField("path", options.path), IntField("row", row + 1)});
      continue;
    }

    std::unordered_map<std::string, std::string> columns;
    columns.reserve(static_cast<size_t>(t.num_columns()));
    for (int c = 0; c < t.num_columns(); ++c) {
      columns.emplace(records.columns[static_cast<size_t>(c)], CellText(*t.column(c), row));
    }
    records.rows.emplace_back(std::move(batch_id), std::move(columns));
  }

  return records;
}

} // namespace batchsync::source
