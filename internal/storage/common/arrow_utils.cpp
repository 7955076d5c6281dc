#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

#include <filesystem>

#include "internal/storage/common/path_utils.hpp"

namespace batchsync::storage::common {

std::string ReadAll(const std::shared_ptr<arrow::io::InputStream>& input, int64_t chunk_bytes) {
  std::string out;
  while (true) {
    auto buffer = Unwrap(input->Read(chunk_bytes));
    if (buffer->size() == 0) break;
    out.append(reinterpret_cast<const char*>(buffer->data()), static_cast<size_t>(buffer->size()));
  }
  return out;
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& root) {
  if (root.empty()) {
    return arrow::Status::Invalid("storage root must not be empty");
  }

  if (root.find("://") != std::string::npos) {
    std::string resolved_path;
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(root, &resolved_path));
    return std::make_pair(std::move(fs), StripTrailingSlash(resolved_path));
  }

  std::error_code ec;
  auto            absolute = std::filesystem::absolute(root, ec);
  if (ec) {
    return arrow::Status::IOError("cannot resolve path '", root, "': ", ec.message());
  }

  std::shared_ptr<arrow::fs::FileSystem> fs = std::make_shared<arrow::fs::LocalFileSystem>();
  return std::make_pair(std::move(fs), StripTrailingSlash(absolute.lexically_normal().generic_string()));
}

} // namespace batchsync::storage::common
