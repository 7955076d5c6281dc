#pragma once

#include <arrow/io/interfaces.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/source/record_source.hpp"

namespace batchsync::source {

struct CsvOptions {
  std::string path;
  char        delimiter = ',';

  // First one present in the header wins. Empty means the defaults below.
  std::vector<std::string> batch_id_columns;

  // Read verbatim as text (no type inference), e.g. the filter columns.
  std::vector<std::string> text_columns;

  uint32_t                  open_attempts = 3;
  std::chrono::milliseconds open_retry_delay{1000};
};

const std::vector<std::string>& DefaultBatchIdColumns();

/*
  Spreadsheet export read with arrow::csv.

  Batch id and text columns keep their exact text (leading zeros
  survive); other columns are stringified; nulls become "".
*/
class CsvRecordSource final : public RecordSource {
 public:
  explicit CsvRecordSource(CsvOptions options);

  model::RecordSet LoadRecords() override;

  // Parses an already opened stream; path is only used in messages.
  static model::RecordSet Parse(std::shared_ptr<arrow::io::InputStream> input, const CsvOptions& options);

 private:
  std::shared_ptr<arrow::io::InputStream> OpenWithRetry();

  CsvOptions options_;
};

} // namespace batchsync::source
