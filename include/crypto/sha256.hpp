// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CRYPTO_SHA256_HPP
#define LUNACHAIN_CRYPTO_SHA256_HPP

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace lunachain {
namespace crypto {

/**
 * Incremental SHA-256 over the OpenSSL EVP interface.
 *
 *   uint256 h;
 *   CSHA256().Write(data, len).Finalize(h.begin());
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const unsigned char *data, size_t len);
  void Finalize(unsigned char hash[OUTPUT_SIZE]);
  CSHA256 &Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

uint256 SHA256(const unsigned char *data, size_t len);
uint256 SHA256(const std::vector<uint8_t> &data);
uint256 SHA256(const std::string &data);

// SHA256(SHA256(data))
uint256 SHA256d(const unsigned char *data, size_t len);
uint256 SHA256d(const std::vector<uint8_t> &data);

} // namespace crypto
} // namespace lunachain

#endif // LUNACHAIN_CRYPTO_SHA256_HPP
