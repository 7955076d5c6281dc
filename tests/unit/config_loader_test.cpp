#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/engine_options.hpp"
#include "internal/util/errors.hpp"

namespace {

using batchsync::config::BuildEngineOptions;
using batchsync::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "batchsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

const char* kMinimal = R"(paths:
  source_root: "/data/results"
  destination_root: "/mnt/archive/results"
records:
  csv_path: "/data/index.csv"
filter:
  match_column: "Status"
  match_value: "Ready"
  empty_column: "Archived"
ledger:
  jsonl:
    path: "/var/lib/batchsync/ledger.jsonl"
)";

void TestMinimalConfigTakesDefaults() {
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("minimal", kMinimal).string());
  assert(config.paths().source_root() == "/data/results");
  assert(config.filter().match_value() == "Ready");
  assert(config.ledger().has_jsonl());
  assert(!config.ledger().jsonl().has_fsync());

  auto options = BuildEngineOptions(config);
  assert(options.transfer.max_copy_retries == 3);
  assert(options.transfer.retry_backoff_base.count() == 500);
  assert(options.transfer.retry_backoff_max.count() == 60000);
  assert(options.worker_pool_size == 4);
  assert(!options.transfer.verify_checksum);
  assert(options.mtime_tolerance.count() == 0);
  assert(options.retention_days == 0);
}

void TestTransferOverrides() {
  auto config = ConfigLoader::LoadFromYamlString(std::string(kMinimal) + R"(transfer:
  max_copy_retries: 5
  retry_backoff_base_ms: 100
  retry_backoff_max_ms: 1000
  worker_pool_size: 8
  verify_checksum: true
  mtime_tolerance_ms: 2000
)");

  auto options = BuildEngineOptions(config);
  assert(options.transfer.max_copy_retries == 5);
  assert(options.transfer.BackoffFor(1).count() == 100);
  assert(options.transfer.BackoffFor(3).count() == 400);
  assert(options.transfer.BackoffFor(10).count() == 1000);
  assert(options.worker_pool_size == 8);
  assert(options.transfer.verify_checksum);
  assert(options.mtime_tolerance.count() == 2000);
  assert(options.transfer.mtime_tolerance.count() == 2000);
}

void TestZeroRetriesRejected() {
  auto config = ConfigLoader::LoadFromYamlString(std::string(kMinimal) + "transfer:\n  max_copy_retries: 0\n");

  bool threw = false;
  try {
    (void)BuildEngineOptions(config);
  } catch (const batchsync::util::ConfigError&) {
    threw = true;
  }
  assert(threw && "zero retries must be rejected");
}

void TestBackoffMaxBelowBaseRejected() {
  auto config = ConfigLoader::LoadFromYamlString(std::string(kMinimal) + "transfer:\n  retry_backoff_base_ms: 5000\n  retry_backoff_max_ms: 10\n");

  bool threw = false;
  try {
    (void)BuildEngineOptions(config);
  } catch (const batchsync::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFilterColumnRejected() {
  auto config = ConfigLoader::LoadFromYamlString(R"(paths:
  source_root: "/a"
  destination_root: "/b"
filter:
  match_column: "Status"
)");

  bool threw = false;
  try {
    (void)BuildEngineOptions(config);
  } catch (const batchsync::util::ConfigError& e) {
    threw = std::string(e.what()).find("filter.empty_column") != std::string::npos;
  }
  assert(threw);
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(filter:
  match_column: "Status"
  match_value: "007"
  empty_column: "Archived"
)");
  assert(config.filter().match_value() == "007");
}

void TestEnvironmentSubstitution() {
  ::setenv("BATCHSYNC_TEST_ROOT", "/srv/share", 1);
  auto config = ConfigLoader::LoadFromYamlString(R"(paths:
  source_root: "${BATCHSYNC_TEST_ROOT}/results"
  destination_root: "${BATCHSYNC_TEST_UNSET_VARIABLE}/dest"
)");
  assert(config.paths().source_root() == "/srv/share/results");
  assert(config.paths().destination_root() == "/dest");

  assert(ConfigLoader::SubstituteEnv("no ${closing") == "no ${closing");
}

void TestSqliteLedgerSelected() {
  auto config = ConfigLoader::LoadFromYamlString(R"(ledger:
  sqlite:
    path: "/tmp/ledger.db"
  retention_days: 30
)");
  assert(config.ledger().has_sqlite());
  assert(config.ledger().sqlite().path() == "/tmp/ledger.db");
  assert(config.ledger().retention_days() == 30);
}

void TestRetentionDaysBounds() {
  using batchsync::config::ParseRetentionDays;

  assert(ParseRetentionDays("0") == 0u);
  assert(ParseRetentionDays("90") == 90u);
  assert(ParseRetentionDays("36500") == 36500u);
  assert(!ParseRetentionDays(""));
  assert(!ParseRetentionDays("-1"));
  assert(!ParseRetentionDays("7d"));
  assert(!ParseRetentionDays(" 7"));
  assert(!ParseRetentionDays("36501"));
  assert(!ParseRetentionDays("99999999999999999999"));

  auto config = ConfigLoader::LoadFromYamlString(std::string(kMinimal) + "  retention_days: 40000\n");
  bool threw  = false;
  try {
    (void)BuildEngineOptions(config);
  } catch (const batchsync::util::ConfigError& e) {
    threw = std::string(e.what()).find("ledger.retention_days") != std::string::npos;
  }
  assert(threw);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", std::string(kMinimal) + "unknown_field: 123\n");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/batchsync/config.yaml");
  } catch (const batchsync::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMinimalConfigTakesDefaults();
  TestTransferOverrides();
  TestZeroRetriesRejected();
  TestBackoffMaxBelowBaseRejected();
  TestMissingFilterColumnRejected();
  TestQuotedNumbersStayStrings();
  TestEnvironmentSubstitution();
  TestSqliteLedgerSelected();
  TestRetentionDaysBounds();
  TestUnknownFieldsAreRejected();
  TestMissingFileRejected();

  std::cout << "batchsync_unit_config_loader: pass\n";
  return 0;
}
