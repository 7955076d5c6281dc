#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/transfer/transfer_options.hpp"

namespace batchsync::config {

/*
  Validated, defaulted engine tunables.

  Unset optional fields take their defaults; explicit zeros where zero
  makes no sense are rejected with util::ConfigError.
*/
struct EngineOptions {
  transfer::TransferOptions transfer;

  uint32_t worker_pool_size = 4;

  std::chrono::milliseconds mtime_tolerance{0};

  uint32_t                  record_open_attempts = 3;
  std::chrono::milliseconds record_open_retry_delay{1000};

  uint32_t retention_days = 0;
};

// Upper bound for ledger retention, in days.
inline constexpr uint32_t kMaxRetentionDays = 36500;

// Decimal day count in [0, kMaxRetentionDays]; nullopt for anything else, including "".
std::optional<uint32_t> ParseRetentionDays(const std::string& text);

EngineOptions BuildEngineOptions(const batchsync::runtime::config::RuntimeConfig& config);

} // namespace batchsync::config
