#pragma once

#include <chrono>
#include <cstdint>

namespace batchsync::transfer {

struct TransferOptions {
  // Attempts per file, including the first.
  uint32_t max_copy_retries = 3;

  std::chrono::milliseconds retry_backoff_base{500};
  std::chrono::milliseconds retry_backoff_max{60000};

  /*
    Per attempt, per file. Enforced between reads: an attempt whose
    reads finish past the deadline fails with Timeout, but a single
    Read blocked on a stalled share is not interrupted and only times
    out once it returns.
  */
  std::chrono::milliseconds copy_timeout{600000};

  uint64_t copy_chunk_bytes = 1 << 20;

  bool verify_checksum = false;

  // Modification times this close count as equal when matching a pending manifest.
  std::chrono::milliseconds mtime_tolerance{0};

  // Delay before attempt n+1 (n >= 1): min(base * 2^(n-1), max).
  std::chrono::milliseconds BackoffFor(uint32_t failed_attempts) const;
};

} // namespace batchsync::transfer
