#pragma once

#include <cstdint>
#include <string>

#include "internal/model/manifest.hpp"

namespace batchsync::model {

enum class Classification : std::uint8_t {
  kNew                = 0,
  kModified           = 1,
  kUnchanged          = 2,
  kDestinationMissing = 3,
};

constexpr bool IsActionable(Classification c) {
  return c != Classification::kUnchanged;
}

inline const char* ClassificationName(Classification c) {
  switch (c) {
    case Classification::kNew:
      return "new";
    case Classification::kModified:
      return "modified";
    case Classification::kUnchanged:
      return "unchanged";
    case Classification::kDestinationMissing:
      return "destination-missing";
  }
  return "unknown";
}

/*
  Unit of transfer for one run.

  Built by the change detector, consumed by the transfer executor.
  Paths are backend paths (already joined with their roots).
*/
struct BatchItem {
  std::string    batch_id;
  std::string    source_path;
  std::string    destination_path;
  Classification classification = Classification::kNew;
  Manifest       file_manifest;
};

} // namespace batchsync::model
