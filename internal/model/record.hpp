#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace batchsync::model {

/*
  One row of the tabular record source.

  Columns are a plain name → text mapping. Lookups are explicit:
  absence of a column is distinct from an empty value.
*/
class Record {
 public:
  Record() = default;
  Record(std::string batch_id, std::unordered_map<std::string, std::string> columns)
      : batch_id_(std::move(batch_id)), columns_(std::move(columns)) {
  }

  const std::string& batch_id() const {
    return batch_id_;
  }

  bool Has(const std::string& column) const {
    return columns_.find(column) != columns_.end();
  }

  std::optional<std::string> Get(const std::string& column) const {
    auto it = columns_.find(column);
    if (it == columns_.end()) return std::nullopt;
    return it->second;
  }

  const std::unordered_map<std::string, std::string>& columns() const {
    return columns_;
  }

 private:
  std::string                                  batch_id_;
  std::unordered_map<std::string, std::string> columns_;
};

// Loaded rows plus the header they were read with. The header is what
// structural validation checks against; rows may still omit columns.
struct RecordSet {
  std::vector<std::string> columns;
  std::vector<Record>      rows;

  bool HasColumn(const std::string& name) const {
    for (const auto& c : columns) {
      if (c == name) return true;
    }
    return false;
  }
};

} // namespace batchsync::model
