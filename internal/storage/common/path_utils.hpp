#pragma once

#include <stdexcept>
#include <string>

namespace batchsync::storage::common {

// Suffix of in-flight copies; never part of a batch.
inline constexpr const char* kStagingSuffix = ".batchsync-tmp";

inline void ValidateBatchId(const std::string& batch_id) {
  if (batch_id.empty()) {
    throw std::invalid_argument("batch id must not be empty");
  }
  for (char c : batch_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("batch id contains invalid character: " + batch_id);
    }
  }
  if (batch_id == "." || batch_id == "..") {
    throw std::invalid_argument("batch id must not be a relative path component");
  }
}

inline std::string StripTrailingSlash(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path;
}

inline std::string JoinPath(const std::string& base, const std::string& name) {
  if (base.empty()) return name;
  if (name.empty()) return base;
  if (base.back() == '/') return base + name;
  return base + "/" + name;
}

inline std::string ParentPath(const std::string& path) {
  auto pos = path.rfind('/');
  if (pos == std::string::npos) return "";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

inline std::string BaseName(const std::string& path) {
  auto pos = path.rfind('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

/*
  path with the dir prefix removed. Throws if path is not below dir.
*/
inline std::string RelativeTo(const std::string& dir, const std::string& path) {
  std::string prefix = StripTrailingSlash(dir);
  if (prefix != "/") prefix += "/";
  if (path.compare(0, prefix.size(), prefix) != 0 || path.size() == prefix.size()) {
    throw std::runtime_error("path '" + path + "' is not below '" + dir + "'");
  }
  return path.substr(prefix.size());
}

inline bool IsStagingName(const std::string& name) {
  const std::string suffix = kStagingSuffix;
  return name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace batchsync::storage::common
