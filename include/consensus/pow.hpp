// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CONSENSUS_POW_HPP
#define LUNACHAIN_CONSENSUS_POW_HPP

#include "chain/arith_uint256.hpp"
#include "primitives/block.hpp"
#include <cstdint>

namespace lunachain {

namespace chain {
class CBlockIndex;
class ChainParams;
struct ConsensusParams;
} // namespace chain

namespace consensus {

/**
 * Windowed difficulty retargeting
 *
 * The target stays constant within a window of nRetargetWindow blocks. The
 * first block of each new window (height % window == 0) gets
 *
 *   new_target = old_target * actual_timespan / expected_timespan
 *
 * where expected_timespan = nPowTargetSpacing * window and actual_timespan is
 * the time covered by the last window block intervals (from the block
 * `window` heights below pindexPrev, or genesis for the first window),
 * clamped to [expected / factor, expected * factor]. The result never
 * exceeds powLimit.
 *
 * @param pindexPrev Parent of the block being built (nullptr for genesis)
 * @return Compact nBits required for the child of pindexPrev
 */
uint32_t GetNextWorkRequired(const chain::CBlockIndex *pindexPrev,
                             const chain::ChainParams &params);

// Pure retarget step, exposed for tests
uint32_t CalculateNextWorkRequired(uint32_t nPrevBits, int64_t nActualTimespan,
                                   const chain::ConsensusParams &params);

// Difficulty relative to powLimit (1.0 = easiest)
double GetDifficulty(uint32_t nBits, const chain::ChainParams &params);

// 0 for negative, overflowing or zero targets
arith_uint256 GetTargetFromBits(uint32_t nBits);

/**
 * True if nBits decodes to a valid target not above powLimit and hash,
 * read as a big-endian number, does not exceed it.
 */
bool CheckProofOfWork(const uint256 &hash, uint32_t nBits,
                      const uint256 &powLimit);

// Computes the header's PoW hash with the network's hasher
bool CheckProofOfWork(const CBlockHeader &header, uint32_t nBits,
                      const chain::ChainParams &params);

} // namespace consensus
} // namespace lunachain

#endif // LUNACHAIN_CONSENSUS_POW_HPP
