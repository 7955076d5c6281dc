#include "storage_factory.hpp"

#include "arrow_fs_store.hpp"
#include "common/arrow_utils.hpp"

namespace batchsync::storage {

StorageLocation StorageFactory::Resolve(const std::string& root) {
  auto [fs, path] = common::Unwrap(common::ResolveFileSystem(root));

  StorageLocation location;
  location.backend = std::make_shared<ArrowFsStore>(std::move(fs));
  location.root    = std::move(path);
  return location;
}

} // namespace batchsync::storage
