#include "checksum.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"

namespace batchsync::transfer {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext NewSha256() {
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 init failed");
  }
  return ctx;
}

void Update(EVP_MD_CTX* ctx, const void* data, size_t len) {
  if (EVP_DigestUpdate(ctx, data, len) != 1) {
    throw std::runtime_error("sha256 update failed");
  }
}

std::string FinishHex(EVP_MD_CTX* ctx) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
    throw std::runtime_error("sha256 final failed");
  }

  static const char* hex = "0123456789abcdef";
  std::string        out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out += hex[(digest[i] >> 4) & 0xF];
    out += hex[digest[i] & 0xF];
  }
  return out;
}

} // namespace

std::string Sha256Hex(const std::shared_ptr<arrow::io::InputStream>& input, int64_t chunk_bytes) {
  auto ctx = NewSha256();
  while (true) {
    auto buffer = storage::common::Unwrap(input->Read(chunk_bytes));
    if (buffer->size() == 0) break;
    Update(ctx.get(), buffer->data(), static_cast<size_t>(buffer->size()));
  }
  return FinishHex(ctx.get());
}

std::string Sha256Hex(const std::string& data) {
  auto ctx = NewSha256();
  Update(ctx.get(), data.data(), data.size());
  return FinishHex(ctx.get());
}

} // namespace batchsync::transfer
