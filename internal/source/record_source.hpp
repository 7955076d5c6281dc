#pragma once

#include <memory>

#include "internal/model/record.hpp"

namespace batchsync::source {

/*
  Supplies the tabular records a run filters.

  Throws util::MalformedRecordSource when the source cannot be read
  or has no usable batch identifier column.
*/
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  virtual model::RecordSet LoadRecords() = 0;
};

using RecordSourcePtr = std::shared_ptr<RecordSource>;

} // namespace batchsync::source
