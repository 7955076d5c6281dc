#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace batchsync::util {

/*
  Time utilities. All clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Compact UTC form used in run ids, e.g. 20261017T083000Z.
std::string FormatCompactUtc(TimePoint tp);

// ISO-8601 UTC with millisecond precision, for reports.
std::string FormatIsoUtc(TimePoint tp);

} // namespace batchsync::util
