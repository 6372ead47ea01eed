// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CRYPTO_RANDOMX_POW_HPP
#define LUNACHAIN_CRYPTO_RANDOMX_POW_HPP

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>

namespace lunachain {
namespace crypto {

/**
 * RandomX proof-of-work (light mode)
 *
 * The RandomX key changes every epoch (block time / epoch duration). One
 * cache per recent epoch is shared by all threads; every thread creates its
 * own VM on top of it, so hashing itself takes no lock.
 */

// Epoch caches kept alive at once
static constexpr int DEFAULT_RANDOMX_VM_CACHE_SIZE = 2;

// nTime / nDuration; 0 when nDuration is 0
uint32_t GetEpoch(uint32_t nTime, uint32_t nDuration);

// SHA256d("LunaChain/RandomX/Epoch/<epoch>")
uint256 GetSeedHash(uint32_t nEpoch);

// Idempotent; hashing before initialization throws
void InitRandomX(int vmCacheSize = DEFAULT_RANDOMX_VM_CACHE_SIZE);

// Releases the shared caches. VMs already held by threads keep theirs alive.
void ShutdownRandomX();

bool IsRandomXInitialized();

// Throws std::runtime_error if RandomX is not initialized or out of memory
uint256 CalculateRandomXHash(const uint8_t *data, size_t len, uint32_t nEpoch);

} // namespace crypto
} // namespace lunachain

#endif // LUNACHAIN_CRYPTO_RANDOMX_POW_HPP
