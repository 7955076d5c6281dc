#pragma once

#include <set>
#include <string>
#include <string_view>

#include "internal/filter/filter_criteria.hpp"
#include "internal/model/record.hpp"

namespace batchsync::filter {

/*
  Selects the batches a run should replicate.

  Comparison is case-sensitive on trimmed text. A row lacking either
  column never qualifies. A record set whose header lacks either column
  is structurally wrong and throws util::MalformedRecordSource.

  Pure: no I/O, no logging.
*/
std::set<std::string> Filter(const model::RecordSet& records, const FilterCriteria& criteria);

bool Qualifies(const model::Record& record, const FilterCriteria& criteria);

std::string_view Trim(std::string_view value);

} // namespace batchsync::filter
