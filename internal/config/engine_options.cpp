#include "engine_options.hpp"

#include <charconv>
#include <string>
#include <system_error>

#include "internal/util/errors.hpp"

namespace batchsync::config {

namespace {

void RequirePositive(uint64_t value, const char* field) {
  if (value == 0) {
    throw util::ConfigError(std::string(field) + " must be greater than zero");
  }
}

void RequireSet(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::ConfigError(std::string(field) + " is required");
  }
}

} // namespace

std::optional<uint32_t> ParseRetentionDays(const std::string& text) {
  uint32_t   days = 0;
  const auto end  = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, days);
  if (text.empty() || ec != std::errc() || ptr != end || days > kMaxRetentionDays) {
    return std::nullopt;
  }
  return days;
}

EngineOptions BuildEngineOptions(const batchsync::runtime::config::RuntimeConfig& config) {
  RequireSet(config.paths().source_root(), "paths.source_root");
  RequireSet(config.paths().destination_root(), "paths.destination_root");
  RequireSet(config.filter().match_column(), "filter.match_column");
  RequireSet(config.filter().empty_column(), "filter.empty_column");

  EngineOptions options;
  const auto&   t = config.transfer();

  if (t.has_max_copy_retries()) {
    RequirePositive(t.max_copy_retries(), "transfer.max_copy_retries");
    options.transfer.max_copy_retries = t.max_copy_retries();
  }
  if (t.has_retry_backoff_base_ms()) {
    options.transfer.retry_backoff_base = std::chrono::milliseconds(t.retry_backoff_base_ms());
  }
  if (t.has_retry_backoff_max_ms()) {
    options.transfer.retry_backoff_max = std::chrono::milliseconds(t.retry_backoff_max_ms());
  }
  if (options.transfer.retry_backoff_max < options.transfer.retry_backoff_base) {
    throw util::ConfigError("transfer.retry_backoff_max_ms must not be below transfer.retry_backoff_base_ms");
  }
  if (t.has_worker_pool_size()) {
    RequirePositive(t.worker_pool_size(), "transfer.worker_pool_size");
    options.worker_pool_size = t.worker_pool_size();
  }
  if (t.has_copy_timeout_ms()) {
    RequirePositive(t.copy_timeout_ms(), "transfer.copy_timeout_ms");
    options.transfer.copy_timeout = std::chrono::milliseconds(t.copy_timeout_ms());
  }
  if (t.has_copy_chunk_bytes()) {
    RequirePositive(t.copy_chunk_bytes(), "transfer.copy_chunk_bytes");
    options.transfer.copy_chunk_bytes = t.copy_chunk_bytes();
  }
  if (t.has_mtime_tolerance_ms()) {
    options.mtime_tolerance          = std::chrono::milliseconds(t.mtime_tolerance_ms());
    options.transfer.mtime_tolerance = options.mtime_tolerance;
  }
  options.transfer.verify_checksum = t.verify_checksum();

  const auto& r = config.records();
  if (r.has_open_attempts()) {
    RequirePositive(r.open_attempts(), "records.open_attempts");
    options.record_open_attempts = r.open_attempts();
  }
  if (r.has_open_retry_delay_ms()) {
    options.record_open_retry_delay = std::chrono::milliseconds(r.open_retry_delay_ms());
  }

  if (config.ledger().retention_days() > kMaxRetentionDays) {
    throw util::ConfigError("ledger.retention_days must not exceed " + std::to_string(kMaxRetentionDays));
  }
  options.retention_days = config.ledger().retention_days();

  return options;
}

} // namespace batchsync::config
