#pragma once

#include <string>

namespace batchsync::util {

/*
  Portable per-operation result codes.

  Storage backends throw; the transfer executor translates those
  exceptions into these values so retry decisions are plain data.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  IOError,
  Timeout,
  Mismatch,
  Cancelled,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ErrorCodeName(ErrorCode code);

} // namespace batchsync::util
