#include "record_filter.hpp"

#include "internal/util/errors.hpp"

namespace batchsync::filter {

std::string_view Trim(std::string_view value) {
  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  const auto                 begin       = value.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) return {};
  const auto end = value.find_last_not_of(kWhitespace);
  return value.substr(begin, end - begin + 1);
}

bool Qualifies(const model::Record& record, const FilterCriteria& criteria) {
  const auto match = record.Get(criteria.match_column);
  const auto empty = record.Get(criteria.empty_column);
  if (!match || !empty) {
    return false;
  }
  return Trim(*match) == Trim(criteria.match_value) && Trim(*empty).empty();
}

std::set<std::string> Filter(const model::RecordSet& records, const FilterCriteria& criteria) {
  if (!records.HasColumn(criteria.match_column)) {
    throw util::MalformedRecordSource("record source has no column '" + criteria.match_column + "'");
  }
  if (!records.HasColumn(criteria.empty_column)) {
    throw util::MalformedRecordSource("record source has no column '" + criteria.empty_column + "'");
  }

  std::set<std::string> selected;
  for (const auto& record : records.rows) {
    if (record.batch_id().empty()) continue;
    if (Qualifies(record, criteria)) {
      selected.insert(record.batch_id());
    }
  }
  return selected;
}

} // namespace batchsync::filter
