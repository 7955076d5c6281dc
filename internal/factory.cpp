#include "factory.hpp"

#include <chrono>
#include <filesystem>

#include "internal/ledger/store/jsonl_ledger_store.hpp"
#include "internal/ledger/store/sqlite_ledger_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/source/csv_record_source.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"

namespace batchsync::factory {

using batchsync::runtime::config::LedgerConfig;
using batchsync::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

char ParseDelimiter(const std::string& value) {
  if (value.empty()) return ',';
  if (value == "\\t" || value == "tab") return '\t';
  if (value.size() != 1) {
    throw util::ConfigError("records.delimiter must be a single character, got '" + value + "'");
  }
  return value[0];
}

source::RecordSourcePtr BuildRecordSource(const RuntimeConfig& config, const config::EngineOptions& options) {
  const auto& r = config.records();
  if (r.csv_path().empty()) {
    throw util::ConfigError("records.csv_path is required");
  }

  source::CsvOptions csv;
  csv.path      = r.csv_path();
  csv.delimiter = ParseDelimiter(r.delimiter());
  csv.batch_id_columns.assign(r.batch_id_columns().begin(), r.batch_id_columns().end());
  csv.text_columns     = {config.filter().match_column(), config.filter().empty_column()};
  csv.open_attempts    = options.record_open_attempts;
  csv.open_retry_delay = options.record_open_retry_delay;
  return std::make_shared<source::CsvRecordSource>(std::move(csv));
}

connectivity::ConnectivityProviderPtr BuildConnectivity(const RuntimeConfig& config) {
  if (config.connectivity().check_command().empty()) {
    return std::make_shared<connectivity::AlwaysConnected>();
  }
  return std::make_shared<connectivity::CommandConnectivityProvider>(config.connectivity().check_command());
}

} // namespace

ledger::LedgerStorePtr BuildLedgerStore(const LedgerConfig& config) {
  switch (config.backend_case()) {
    case LedgerConfig::kJsonl: {
      if (config.jsonl().path().empty()) throw util::ConfigError("ledger.jsonl.path is required");
      const bool fsync = config.jsonl().has_fsync() ? config.jsonl().fsync() : true;
      return std::make_shared<ledger::JsonlLedgerStore>(config.jsonl().path(), fsync);
    }
    case LedgerConfig::kSqlite: {
      if (config.sqlite().path().empty()) throw util::ConfigError("ledger.sqlite.path is required");
      auto parent = std::filesystem::path(config.sqlite().path()).parent_path();
      if (!parent.empty()) std::filesystem::create_directories(parent);
      return std::make_shared<ledger::SqliteLedgerStore>(config.sqlite().path());
    }
    case LedgerConfig::BACKEND_NOT_SET:
    default:
      throw util::ConfigError("ledger backend must be configured (ledger.jsonl or ledger.sqlite)");
  }
}

ledger::LedgerStorePtr OpenLedgerStore(const std::string& path) {
  if (std::filesystem::path(path).extension() == ".jsonl") {
    return std::make_shared<ledger::JsonlLedgerStore>(path);
  }
  return std::make_shared<ledger::SqliteLedgerStore>(path);
}

Application Build(const RuntimeConfig& config, bool dry_run) {
  Application app;

  // ------------------------------------------------------------------
  // Options
  // ------------------------------------------------------------------
  app.options = config::BuildEngineOptions(config);

  app.criteria.match_column = config.filter().match_column();
  app.criteria.match_value  = config.filter().match_value();
  app.criteria.empty_column = config.filter().empty_column();

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.source      = storage::StorageFactory::Resolve(config.paths().source_root());
  app.destination = storage::StorageFactory::Resolve(config.paths().destination_root());

  // ------------------------------------------------------------------
  // Records and ledger
  // ------------------------------------------------------------------
  app.records = BuildRecordSource(config, app.options);
  app.ledger  = std::make_shared<ledger::TransactionLedger>(BuildLedgerStore(config.ledger()), app.options.mtime_tolerance);

  // no run has started yet, so compacting here never rewrites a live ledger
  if (app.options.retention_days > 0 && !dry_run) {
    app.ledger->Compact(std::chrono::hours(24) * app.options.retention_days);
  }

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.connectivity = BuildConnectivity(config);
  app.notifier     = std::make_shared<notify::LogNotifier>();

  // ------------------------------------------------------------------
  // Coordinator
  // ------------------------------------------------------------------
  coordinator::CoordinatorOptions coordinator_options;
  coordinator_options.worker_pool_size       = app.options.worker_pool_size;
  coordinator_options.transfer               = app.options.transfer;
  coordinator_options.detect.mtime_tolerance = app.options.mtime_tolerance;
  coordinator_options.dry_run                = dry_run;
  app.coordinator                            = std::make_unique<coordinator::RunCoordinator>(std::move(coordinator_options));

  BATCHSYNC_LOG_INFO("runtime built", {StringField("source", app.source.root), StringField("destination", app.destination.root),
                                       StringField("connectivity", app.connectivity->Describe())});
  return app;
}

} // namespace batchsync::factory
