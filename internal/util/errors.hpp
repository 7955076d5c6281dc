#pragma once

#include <stdexcept>
#include <string>

namespace batchsync::util {

/*
  Central error types.

  Structural and fatal conditions only. Per-file copy problems are
  reported as util::Result values (see result.hpp) and end up in the
  ledger, never as exceptions leaving the run.
*/

// Record set lacks the declared columns. Aborts the run before any transfer.
class MalformedRecordSource : public std::runtime_error {
 public:
  explicit MalformedRecordSource(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Batch source directory could not be enumerated. Per item.
class SourceUnreadable : public std::runtime_error {
 public:
  SourceUnreadable(std::string batch_id, const std::string& msg) : std::runtime_error(msg), batch_id_(std::move(batch_id)) {
  }

  const std::string& batch_id() const {
    return batch_id_;
  }

 private:
  std::string batch_id_;
};

// Ledger could not durably record a transition. Fatal for the run.
class LedgerWriteError : public std::runtime_error {
 public:
  explicit LedgerWriteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace batchsync::util
