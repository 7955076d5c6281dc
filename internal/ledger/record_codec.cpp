#include "record_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace batchsync::ledger {

batchsync::ledger::v1::Manifest ToProto(const model::Manifest& manifest) {
  batchsync::ledger::v1::Manifest out;
  for (const auto& entry : manifest) {
    auto* file = out.add_files();
    file->set_relative_path(entry.relative_path);
    file->set_size_bytes(entry.size_bytes);
    file->set_modified_time_ns(entry.modified_time_ns);
    file->set_sha256(entry.sha256);
  }
  return out;
}

model::Manifest FromProto(const batchsync::ledger::v1::Manifest& manifest) {
  model::Manifest out;
  out.reserve(static_cast<size_t>(manifest.files_size()));
  for (const auto& file : manifest.files()) {
    model::FileEntry entry;
    entry.relative_path    = file.relative_path();
    entry.size_bytes       = file.size_bytes();
    entry.modified_time_ns = file.modified_time_ns();
    entry.sha256           = file.sha256();
    out.push_back(std::move(entry));
  }
  model::SortManifest(out);
  return out;
}

std::string EncodeJson(const LedgerRecord& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = false;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json, options);
  if (!status.ok()) {
    throw util::LedgerWriteError("failed to encode ledger record: " + status.ToString());
  }
  return json;
}

std::optional<LedgerRecord> DecodeJson(const std::string& line) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  LedgerRecord record;
  auto         status = google::protobuf::util::JsonStringToMessage(line, &record, options);
  if (!status.ok()) return std::nullopt;
  if (record.run_id().empty() || record.batch_id().empty()) return std::nullopt;
  return record;
}

} // namespace batchsync::ledger
