// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "crypto/pow_hasher.hpp"
#include "crypto/randomx_pow.hpp"
#include "crypto/sha256.hpp"

namespace lunachain {
namespace crypto {

uint256 Sha256dPowHasher::Hash(const CBlockHeader::HeaderBytes &bytes,
                               uint32_t /*nTime*/) const {
  return SHA256d(bytes.data(), bytes.size());
}

RandomXPowHasher::RandomXPowHasher(uint32_t epoch_duration)
    : epoch_duration_(epoch_duration) {
  InitRandomX();
}

uint256 RandomXPowHasher::Hash(const CBlockHeader::HeaderBytes &bytes,
                               uint32_t nTime) const {
  return CalculateRandomXHash(bytes.data(), bytes.size(),
                              GetEpoch(nTime, epoch_duration_));
}

std::shared_ptr<const PowHasher> CreatePowHasher(PowAlgorithm algo,
                                                 uint32_t epoch_duration) {
  switch (algo) {
  case PowAlgorithm::RANDOMX:
    return std::make_shared<RandomXPowHasher>(epoch_duration);
  case PowAlgorithm::SHA256D:
    break;
  }
  return std::make_shared<Sha256dPowHasher>();
}

} // namespace crypto
} // namespace lunachain
