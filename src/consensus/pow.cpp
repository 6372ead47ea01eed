// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "consensus/pow.hpp"
#include "chain/block_index.hpp"
#include "chain/chainparams.hpp"
#include <algorithm>

namespace lunachain {
namespace consensus {

uint32_t GetNextWorkRequired(const chain::CBlockIndex *pindexPrev,
                             const chain::ChainParams &params) {
  const auto &consensus = params.GetConsensus();
  const uint32_t nProofOfWorkLimit =
      GetCompact(UintToArith256(consensus.powLimit));

  // Genesis block - use powLimit
  if (pindexPrev == nullptr) {
    return nProofOfWorkLimit;
  }

  if (consensus.fPowNoRetargeting) {
    return nProofOfWorkLimit;
  }

  const int64_t window = consensus.DifficultyAdjustmentInterval();

  // Only change once per window
  if ((pindexPrev->nHeight + 1) % window != 0) {
    return pindexPrev->nBits;
  }

  // Last block of the window before: window intervals end at pindexPrev
  const int nHeightFirst = pindexPrev->nHeight - static_cast<int>(window);
  const chain::CBlockIndex *pindexFirst =
      pindexPrev->GetAncestor(std::max(nHeightFirst, 0));
  if (pindexFirst == nullptr) {
    return pindexPrev->nBits;
  }

  return CalculateNextWorkRequired(
      pindexPrev->nBits, pindexPrev->GetBlockTime() - pindexFirst->GetBlockTime(),
      consensus);
}

uint32_t CalculateNextWorkRequired(uint32_t nPrevBits, int64_t nActualTimespan,
                                   const chain::ConsensusParams &params) {
  const int64_t nTargetTimespan =
      params.nPowTargetSpacing * params.nRetargetWindow;
  const int64_t factor = std::max<int64_t>(params.nMaxRetargetFactor, 1);

  nActualTimespan = std::clamp(nActualTimespan, nTargetTimespan / factor,
                               nTargetTimespan * factor);
  // A zero timespan would zero the target
  nActualTimespan = std::max<int64_t>(nActualTimespan, 1);

  const arith_uint256 bnPowLimit = UintToArith256(params.powLimit);
  arith_uint256 bnOld = GetTargetFromBits(nPrevBits);
  if (bnOld == 0) {
    return GetCompact(bnPowLimit);
  }

  // 512-bit intermediate: old target (<2^256) * timespan cannot overflow
  arith_uint512 bnNew = arith_uint512(bnOld);
  bnNew *= static_cast<uint64_t>(nActualTimespan);
  bnNew /= static_cast<uint64_t>(nTargetTimespan);

  if (bnNew > arith_uint512(bnPowLimit)) {
    return GetCompact(bnPowLimit);
  }
  arith_uint256 result = bnNew.convert_to<arith_uint256>();
  if (result == 0) {
    result = 1;
  }
  return GetCompact(result);
}

double GetDifficulty(uint32_t nBits, const chain::ChainParams &params) {
  const arith_uint256 powLimit = UintToArith256(params.GetConsensus().powLimit);
  arith_uint256 target = GetTargetFromBits(nBits);
  if (target == 0 || target > powLimit) {
    return 0.0;
  }
  return powLimit.convert_to<double>() / target.convert_to<double>();
}

arith_uint256 GetTargetFromBits(uint32_t nBits) {
  bool fNegative = false;
  bool fOverflow = false;
  arith_uint256 target = SetCompact(nBits, &fNegative, &fOverflow);

  if (fNegative || fOverflow || target == 0) {
    return arith_uint256(0);
  }
  return target;
}

bool CheckProofOfWork(const uint256 &hash, uint32_t nBits,
                      const uint256 &powLimit) {
  arith_uint256 bnTarget = GetTargetFromBits(nBits);
  if (bnTarget == 0 || bnTarget > UintToArith256(powLimit)) {
    return false;
  }
  return UintToArith256(hash) <= bnTarget;
}

bool CheckProofOfWork(const CBlockHeader &header, uint32_t nBits,
                      const chain::ChainParams &params) {
  uint256 pow_hash = params.GetPowHasher().Hash(header);
  return CheckProofOfWork(pow_hash, nBits, params.GetConsensus().powLimit);
}

} // namespace consensus
} // namespace lunachain
