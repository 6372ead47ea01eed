// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CRYPTO_POW_HASHER_HPP
#define LUNACHAIN_CRYPTO_POW_HASHER_HPP

#include "primitives/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace lunachain {
namespace crypto {

enum class PowAlgorithm {
  SHA256D, // regtest and unit tests
  RANDOMX  // main and test networks
};

/**
 * Proof-of-work hash function over serialized headers.
 *
 * Implementations must be safe to call from several miner threads at once.
 */
class PowHasher {
public:
  virtual ~PowHasher() = default;

  virtual uint256 Hash(const CBlockHeader::HeaderBytes &bytes,
                       uint32_t nTime) const = 0;
  virtual std::string Name() const = 0;

  uint256 Hash(const CBlockHeader &header) const {
    return Hash(header.SerializeFixed(), header.nTime);
  }
};

// PoW hash equals the block identity hash
class Sha256dPowHasher final : public PowHasher {
public:
  uint256 Hash(const CBlockHeader::HeaderBytes &bytes,
               uint32_t nTime) const override;
  using PowHasher::Hash;
  std::string Name() const override { return "sha256d"; }
};

// Seeds rotate every epoch_duration seconds of block time
class RandomXPowHasher final : public PowHasher {
public:
  explicit RandomXPowHasher(uint32_t epoch_duration);

  uint256 Hash(const CBlockHeader::HeaderBytes &bytes,
               uint32_t nTime) const override;
  using PowHasher::Hash;
  std::string Name() const override { return "randomx"; }

private:
  uint32_t epoch_duration_;
};

std::shared_ptr<const PowHasher> CreatePowHasher(PowAlgorithm algo,
                                                 uint32_t epoch_duration);

} // namespace crypto
} // namespace lunachain

#endif // LUNACHAIN_CRYPTO_POW_HASHER_HPP
