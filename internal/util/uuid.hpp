#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace batchsync::util {

/*
  UUID helpers

  Random RFC4122 version 4 ids. Used for run ids and staging file names.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Timestamp-derived run id: <compact utc>-<first 8 hex chars of a uuid>.
// Lexicographic order follows wall-clock order at second granularity.
std::string GenerateRunId();

} // namespace batchsync::util
