#pragma once

#include <string>

namespace batchsync::filter {

// A record qualifies iff record[match_column] == match_value
// and record[empty_column] is blank.
struct FilterCriteria {
  std::string match_column;
  std::string match_value;
  std::string empty_column;
};

} // namespace batchsync::filter
