// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_PRIMITIVES_TRANSACTION_HPP
#define LUNACHAIN_PRIMITIVES_TRANSACTION_HPP

#include "util/serialize.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lunachain {

// Amounts are integer base units
using CAmount = int64_t;

static constexpr CAmount COIN = 100'000'000;
static constexpr CAmount MAX_MONEY = 21'000'000'000 * COIN;

inline bool MoneyRange(CAmount value) {
  return value >= 0 && value <= MAX_MONEY;
}

/**
 * Mutable transaction used while building and signing.
 *
 * Wire format (little-endian):
 *   sender (string) | recipient (string) | amount (i64) | fee (i64) |
 *   nonce (u64) | timestamp (i64) | sender_pubkey (bytes) | signature (bytes)
 */
struct CMutableTransaction {
  std::string sender;
  std::string recipient;
  CAmount amount{0};
  CAmount fee{0};
  uint64_t nonce{0};
  int64_t timestamp{0};
  std::vector<uint8_t> sender_pubkey;
  std::vector<uint8_t> signature;

  // SHA256d of every field except the signature
  uint256 GetSignatureHash() const;

  void Serialize(DataStream &s) const;
  void Unserialize(DataStream &s);
};

/**
 * Immutable transaction, identified by the SHA256d of its full serialization.
 * Shared between the mempool, blocks and the chain as CTransactionRef.
 */
class CTransaction {
public:
  const std::string sender;
  const std::string recipient;
  const CAmount amount;
  const CAmount fee;
  const uint64_t nonce;
  const int64_t timestamp;
  const std::vector<uint8_t> sender_pubkey;
  const std::vector<uint8_t> signature;

  explicit CTransaction(const CMutableTransaction &tx);
  explicit CTransaction(CMutableTransaction &&tx);

  const uint256 &GetHash() const { return hash_; }
  uint256 GetSignatureHash() const;

  // Serialized size in bytes, the denominator of the fee rate
  size_t GetTotalSize() const { return total_size_; }

  void Serialize(DataStream &s) const;

  std::string ToString() const;

  friend bool operator==(const CTransaction &a, const CTransaction &b) {
    return a.hash_ == b.hash_;
  }

private:
  uint256 ComputeHash() const;

  const uint256 hash_;
  const size_t total_size_;
};

using CTransactionRef = std::shared_ptr<const CTransaction>;

template <typename Tx> CTransactionRef MakeTransactionRef(Tx &&tx) {
  return std::make_shared<const CTransaction>(std::forward<Tx>(tx));
}

// Throws std::ios_base::failure on malformed input
CTransactionRef DeserializeTransaction(DataStream &s);

} // namespace lunachain

#endif // LUNACHAIN_PRIMITIVES_TRANSACTION_HPP
