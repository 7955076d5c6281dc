#include "result.hpp"

namespace batchsync::util {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not-found";
    case ErrorCode::IOError:
      return "io-error";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::Mismatch:
      return "mismatch";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::InternalError:
    default:
      return "internal-error";
  }
}

} // namespace batchsync::util
