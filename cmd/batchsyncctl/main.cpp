#include <chrono>
#include <iostream>
#include <string>

#include "internal/config/engine_options.hpp"
#include "internal/factory.hpp"
#include "internal/ledger/transaction_ledger.hpp"
#include "internal/model/run_summary.hpp"
#include "internal/util/time.hpp"

#include <spdlog/spdlog.h>

using batchsync::ledger::TransactionLedger;

static void Usage() {
  std::cout << "Usage:\n"
            << "  batchsyncctl <ledger> pending\n"
            << "  batchsyncctl <ledger> summary\n"
            << "  batchsyncctl <ledger> history <batch_id>\n"
            << "  batchsyncctl <ledger> manifest <batch_id>\n"
            << "  batchsyncctl <ledger> compact <retention_days>\n"
            << "\n"
            << "  <ledger> ending in .jsonl is read as a JSONL ledger, anything else as SQLite.\n";
}

static int Pending(const TransactionLedger& ledger) {
  auto pending = ledger.PendingIncomplete();
  if (pending.empty()) {
    std::cout << "no pending transactions\n";
    return 0;
  }
  for (const auto& p : pending) {
    std::cout << p.batch_id << "\trun=" << p.run_id << "\tphase=" << batchsync::model::PhaseName(p.phase) << "\tcopied=" << p.copied.size() << "/"
              << p.manifest.size() << "\tstarted=" << batchsync::util::FormatIsoUtc(p.started_at) << "\n";
  }
  return 0;
}

static int Summary(const TransactionLedger& ledger) {
  auto stats = ledger.Stats();
  std::cout << "transactions:     " << stats.transactions << "\n"
            << "  completed:      " << stats.completed << "\n"
            << "  failed:         " << stats.failed << "\n"
            << "  pending:        " << stats.pending << "\n"
            << "batches:          " << stats.batches << "\n"
            << "files copied:     " << stats.files_copied << "\n"
            << "bytes replicated: " << batchsync::model::FormatBytes(stats.bytes_replicated) << "\n"
            << "last record:      " << (stats.last_record ? batchsync::util::FormatIsoUtc(*stats.last_record) : std::string("-")) << "\n";
  return 0;
}

static int History(const TransactionLedger& ledger, const std::string& batch_id) {
  auto records = ledger.History(batch_id);
  if (records.empty()) {
    std::cerr << "no records for batch " << batch_id << "\n";
    return 1;
  }
  for (const auto& r : records) {
    std::cout << batchsync::util::FormatIsoUtc(batchsync::util::FromProto(r.timestamp())) << "\t" << r.run_id() << "\t"
              << batchsync::model::PhaseName(r.phase());
    if (!r.relative_path().empty()) std::cout << "\t" << r.relative_path();
    if (!r.reason().empty()) std::cout << "\t" << r.reason();
    if (r.attempts() > 0) std::cout << "\tattempts=" << r.attempts();
    std::cout << "\n";
  }
  return 0;
}

static int Manifest(const TransactionLedger& ledger, const std::string& batch_id) {
  auto manifest = ledger.LatestCompletedManifest(batch_id);
  if (!manifest) {
    std::cerr << "batch " << batch_id << " has never completed\n";
    return 1;
  }
  for (const auto& entry : *manifest) {
    std::cout << entry.relative_path << "\t" << entry.size_bytes << "\t" << entry.modified_time_ns;
    if (!entry.sha256.empty()) std::cout << "\t" << entry.sha256;
    std::cout << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string path = argv[1];
  std::string cmd  = argv[2];

  // keep stdout for command output
  spdlog::set_level(spdlog::level::warn);

  try {
    TransactionLedger ledger(batchsync::factory::OpenLedgerStore(path));

    if (cmd == "pending") {
      return Pending(ledger);
    }
    if (cmd == "summary") {
      return Summary(ledger);
    }
    if (cmd == "history" && argc == 4) {
      return History(ledger, argv[3]);
    }
    if (cmd == "manifest" && argc == 4) {
      return Manifest(ledger, argv[3]);
    }
    if (cmd == "compact" && argc == 4) {
      auto days = batchsync::config::ParseRetentionDays(argv[3]);
      if (!days) {
        std::cerr << "invalid retention (0.." << batchsync::config::kMaxRetentionDays << " days): '" << argv[3] << "'\n";
        return 1;
      }
      auto removed = ledger.Compact(std::chrono::hours(24) * *days);
      std::cout << "removed " << removed << " transactions\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
