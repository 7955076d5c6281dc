#include "internal/filter/record_filter.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using batchsync::filter::FilterCriteria;
using batchsync::testing::MakeRecords;

const FilterCriteria kCriteria{"Status", "Ready", "Archived"};

void TestSelectsMatchingRowsWithEmptyColumn() {
  auto records = MakeRecords({"Batch ID", "Status", "Archived"}, {
                                                                     {"B1", "Ready", ""},
                                                                     {"B2", "Ready", "2026-01-01"},
                                                                     {"B3", "Pending", ""},
                                                                     {"B4", "Ready", ""},
                                                                 });

  auto selected = batchsync::filter::Filter(records, kCriteria);
  assert(selected.size() == 2);
  assert(selected.contains("B1"));
  assert(selected.contains("B4"));
}

void TestWhitespaceIsTrimmedButCaseMatters() {
  auto records = MakeRecords({"Batch ID", "Status", "Archived"}, {
                                                                     {"B1", "  Ready\t", "   "},
                                                                     {"B2", "ready", ""},
                                                                     {"B3", "READY", ""},
                                                                 });

  auto selected = batchsync::filter::Filter(records, kCriteria);
  assert(selected.size() == 1);
  assert(selected.contains("B1"));
}

void TestDuplicateIdsCollapse() {
  auto records = MakeRecords({"Batch ID", "Status", "Archived"}, {
                                                                     {"B1", "Ready", ""},
                                                                     {"B1", "Ready", ""},
                                                                 });
  assert(batchsync::filter::Filter(records, kCriteria).size() == 1);
}

void TestRowMissingColumnNeverQualifies() {
  batchsync::model::RecordSet records;
  records.columns = {"Batch ID", "Status", "Archived"};
  records.rows.emplace_back("B1", std::unordered_map<std::string, std::string>{{"Batch ID", "B1"}, {"Status", "Ready"}});
  records.rows.emplace_back("B2", std::unordered_map<std::string, std::string>{{"Batch ID", "B2"}, {"Status", "Ready"}, {"Archived", ""}});

  assert(!batchsync::filter::Qualifies(records.rows[0], kCriteria));

  auto selected = batchsync::filter::Filter(records, kCriteria);
  assert(selected.size() == 1);
  assert(selected.contains("B2"));
}

void TestHeaderWithoutColumnIsMalformed() {
  auto records = MakeRecords({"Batch ID", "Status"}, {{"B1", "Ready"}});

  bool threw = false;
  try {
    (void)batchsync::filter::Filter(records, kCriteria);
  } catch (const batchsync::util::MalformedRecordSource& e) {
    threw = std::string(e.what()).find("Archived") != std::string::npos;
  }
  assert(threw && "missing empty_column must be reported");
}

void TestEmptyRecordSetSelectsNothing() {
  auto records = MakeRecords({"Batch ID", "Status", "Archived"}, {});
  assert(batchsync::filter::Filter(records, kCriteria).empty());
}

void TestTrim() {
  assert(batchsync::filter::Trim("") == "");
  assert(batchsync::filter::Trim(" \t\r\n") == "");
  assert(batchsync::filter::Trim("  a b  ") == "a b");
}

} // namespace

int main() {
  TestSelectsMatchingRowsWithEmptyColumn();
  TestWhitespaceIsTrimmedButCaseMatters();
  TestDuplicateIdsCollapse();
  TestRowMissingColumnNeverQualifies();
  TestHeaderWithoutColumnIsMalformed();
  TestEmptyRecordSetSelectsNothing();
  TestTrim();

  std::cout << "batchsync_unit_record_filter: pass\n";
  return 0;
}
