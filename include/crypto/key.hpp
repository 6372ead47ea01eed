// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CRYPTO_KEY_HPP
#define LUNACHAIN_CRYPTO_KEY_HPP

#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ec_key_st;

namespace lunachain {
namespace crypto {

// Address prefix followed by 40 lowercase hex characters
static constexpr const char *ADDRESS_PREFIX = "LUN_";
static constexpr size_t ADDRESS_HASH_BYTES = 20;

// 33-byte compressed secp256k1 public key
using PubKey = std::vector<uint8_t>;

/**
 * secp256k1 private key (OpenSSL EC_KEY)
 *
 * Signatures are DER-encoded ECDSA over a 32-byte message hash.
 */
class CKey {
public:
  CKey();
  ~CKey();

  CKey(CKey &&) noexcept;
  CKey &operator=(CKey &&) noexcept;
  CKey(const CKey &) = delete;
  CKey &operator=(const CKey &) = delete;

  // Fresh random key. Returns false if OpenSSL fails.
  bool MakeNewKey();

  // Load a 32-byte big-endian secret; rejects zero and out-of-range values
  bool SetSecret(const std::vector<uint8_t> &secret);
  std::vector<uint8_t> GetSecret() const;

  bool IsValid() const { return key_ != nullptr; }

  PubKey GetPubKey() const;
  std::string GetAddress() const;

  // Empty vector on failure
  std::vector<uint8_t> Sign(const uint256 &hash) const;

private:
  struct KeyDeleter {
    void operator()(ec_key_st *key) const;
  };
  std::unique_ptr<ec_key_st, KeyDeleter> key_;
};

// False for malformed keys or signatures as well as mismatches
bool VerifySignature(const PubKey &pubkey, const uint256 &hash,
                     const std::vector<uint8_t> &signature);

// LUN_ + hex(first 20 bytes of SHA256(pubkey))
std::string AddressFromPubKey(const PubKey &pubkey);

/**
 * Canonical form of a user-supplied address: surrounding whitespace and
 * quotes stripped, prefix matched case-insensitively, hex lowercased.
 * Returns nullopt if the result is not a well-formed address.
 */
std::optional<std::string> NormalizeAddress(const std::string &address);

// True only for already-canonical addresses
bool IsValidAddress(const std::string &address);

// Conversions between a canonical address and its 20-byte payload
std::string AddressFromHash(const uint160 &hash);
std::optional<uint160> AddressToHash(const std::string &address);

} // namespace crypto
} // namespace lunachain

#endif // LUNACHAIN_CRYPTO_KEY_HPP
