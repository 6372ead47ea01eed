// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "crypto/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace lunachain {
namespace crypto {

void CSHA256::CtxDeleter::operator()(evp_md_ctx_st *ctx) const {
  EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  Reset();
}

CSHA256::~CSHA256() = default;

CSHA256 &CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return *this;
}

CSHA256 &CSHA256::Write(const unsigned char *data, size_t len) {
  if (len > 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &out_len) != 1 ||
      out_len != OUTPUT_SIZE) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
}

uint256 SHA256(const unsigned char *data, size_t len) {
  uint256 out;
  CSHA256().Write(data, len).Finalize(out.begin());
  return out;
}

uint256 SHA256(const std::vector<uint8_t> &data) {
  return SHA256(data.data(), data.size());
}

uint256 SHA256(const std::string &data) {
  return SHA256(reinterpret_cast<const unsigned char *>(data.data()),
                data.size());
}

uint256 SHA256d(const unsigned char *data, size_t len) {
  uint256 h1 = SHA256(data, len);
  return SHA256(h1.begin(), h1.size());
}

uint256 SHA256d(const std::vector<uint8_t> &data) {
  return SHA256d(data.data(), data.size());
}

} // namespace crypto
} // namespace lunachain
