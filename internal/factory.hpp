#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/config/engine_options.hpp"
#include "internal/connectivity/connectivity_provider.hpp"
#include "internal/coordinator/run_coordinator.hpp"
#include "internal/filter/filter_criteria.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/ledger/transaction_ledger.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/source/record_source.hpp"
#include "internal/storage/storage_backend.hpp"

namespace batchsync::factory {

/*
  Application

  Everything one replication pass needs, built from configuration.
  Lives for the lifetime of the process.
*/
struct Application {
  config::EngineOptions options;

  storage::StorageLocation source;
  storage::StorageLocation destination;

  filter::FilterCriteria criteria;

  source::RecordSourcePtr                    records;
  std::shared_ptr<ledger::TransactionLedger> ledger;

  connectivity::ConnectivityProviderPtr connectivity;
  notify::NotifierPtr                   notifier;

  std::unique_ptr<coordinator::RunCoordinator> coordinator;
};

/*
  Build

  Composition root. The only place that knows concrete store, source
  and backend types. Throws util::ConfigError for invalid settings.

  With ledger.retention_days set, the ledger is compacted once here,
  before any run (skipped for dry runs).
*/
Application Build(const batchsync::runtime::config::RuntimeConfig& config, bool dry_run = false);

ledger::LedgerStorePtr BuildLedgerStore(const batchsync::runtime::config::LedgerConfig& config);

// *.jsonl → JSONL store, anything else → SQLite store.
ledger::LedgerStorePtr OpenLedgerStore(const std::string& path);

} // namespace batchsync::factory
