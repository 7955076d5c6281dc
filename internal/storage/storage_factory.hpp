#pragma once

#include <string>

#include "storage_backend.hpp"

namespace batchsync::storage {

/*
  Builds storage locations from configured roots.

  Runtime uses this as:

      auto source = StorageFactory::Resolve(cfg.paths().source_root());
      source.backend->Enumerate(source.PathOf(batch_id));
*/

class StorageFactory {
 public:
  static StorageLocation Resolve(const std::string& root);
};

} // namespace batchsync::storage
