#include "transfer_options.hpp"

#include <algorithm>

namespace batchsync::transfer {

std::chrono::milliseconds TransferOptions::BackoffFor(uint32_t failed_attempts) const {
  if (failed_attempts == 0) return std::chrono::milliseconds(0);

  auto delay = retry_backoff_base;
  for (uint32_t i = 1; i < failed_attempts && delay < retry_backoff_max; ++i) {
    delay *= 2;
  }
  return std::min(delay, retry_backoff_max);
}

} // namespace batchsync::transfer
