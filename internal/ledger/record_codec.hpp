#pragma once

#include <optional>
#include <string>

#include "internal/ledger/ledger_store.hpp"
#include "internal/model/manifest.hpp"

namespace batchsync::ledger {

batchsync::ledger::v1::Manifest ToProto(const model::Manifest& manifest);
model::Manifest                 FromProto(const batchsync::ledger::v1::Manifest& manifest);

// Single-line JSON, snake_case field names.
std::string EncodeJson(const LedgerRecord& record);

// nullopt for anything that does not parse as a record.
std::optional<LedgerRecord> DecodeJson(const std::string& line);

} // namespace batchsync::ledger
