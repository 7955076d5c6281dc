#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "internal/ledger/transaction_ledger.hpp"
#include "internal/model/batch_item.hpp"
#include "internal/storage/storage_backend.hpp"

namespace batchsync::detect {

struct DetectOptions {
  // Modification times closer than this compare equal.
  std::chrono::milliseconds mtime_tolerance{0};
};

/*
  Classify one batch:

      source listing ──► destination dir exists? ── no ──► DestinationMissing
                                 │ yes
                                 ▼
                  last COMPLETED manifest? ── no ──► New
                                 │ yes
                                 ▼
         failed/pending transaction since? ── yes ──► Modified
                                 │ no
                                 ▼
                   manifests equal? ── no ──► Modified
                                 │ yes
                                 ▼
                             Unchanged

  Throws util::SourceUnreadable when the source directory is missing
  or cannot be enumerated. Reads the ledger, never writes it.
*/
model::BatchItem Classify(const std::string& batch_id, const storage::StorageLocation& source, const storage::StorageLocation& destination,
                          const ledger::TransactionLedger& ledger, const DetectOptions& options = {});

/*
  Directory name of a batch under the source root: the batch id
  itself, else a case-insensitive exact match among the root's
  children. nullopt if neither exists.
*/
std::optional<std::string> LocateSourceDirectory(const std::string& batch_id, const storage::StorageLocation& source);

} // namespace batchsync::detect
