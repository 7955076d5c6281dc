#pragma once

#include <arrow/io/interfaces.h>

#include <memory>
#include <string>

namespace batchsync::transfer {

// Lowercase hex SHA-256 of everything remaining in input.
std::string Sha256Hex(const std::shared_ptr<arrow::io::InputStream>& input, int64_t chunk_bytes = 1 << 20);

std::string Sha256Hex(const std::string& data);

} // namespace batchsync::transfer
