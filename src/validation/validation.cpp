// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "validation/validation.hpp"
#include "chain/block_index.hpp"
#include "chain/chainparams.hpp"
#include "consensus/pow.hpp"
#include "consensus/tx_verification.hpp"
#include "util/time.hpp"
#include <set>

namespace lunachain {
namespace validation {

bool CheckBlockHeader(const CBlockHeader &header,
                      const chain::ChainParams &params,
                      BlockValidationState &state) {
  if (!consensus::CheckProofOfWork(header, header.nBits, params)) {
    return state.Invalid(BlockValidationResult::BLOCK_INVALID_POW, "high-hash",
                         "proof of work failed");
  }
  return true;
}

bool CheckBlock(const CBlock &block, const chain::ChainParams &params,
                BlockValidationState &state) {
  const auto &settings = params.GetSettings();

  if (block.nVersion < 1) {
    return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL, "bad-version",
                         "block version too old: " +
                             std::to_string(block.nVersion));
  }
  if (block.nHeight < 1 || block.hashPrevBlock.IsNull()) {
    return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL, "bad-height",
                         "only the genesis block may lack a parent");
  }
  if (block.vtx.size() > settings.max_block_transactions) {
    return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                         "bad-blk-tx-count",
                         std::to_string(block.vtx.size()) + " transactions");
  }
  const size_t size = block.GetSerializedSize();
  if (size > settings.max_block_bytes) {
    return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                         "bad-blk-length", std::to_string(size) + " bytes");
  }
  if (BlockMerkleRoot(block) != block.hashMerkleRoot) {
    return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                         "bad-txnmrklroot", "hashMerkleRoot mismatch");
  }

  std::set<uint256> seen;
  for (const auto &tx : block.vtx) {
    if (!seen.insert(tx->GetHash()).second) {
      return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                           "bad-txns-duplicate", tx->GetHash().ToString());
    }
    TxValidationState tx_state;
    if (!consensus::CheckTransaction(*tx, tx_state)) {
      return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                           "bad-txns-malformed", tx_state.ToString());
    }
  }
  return true;
}

bool ContextualCheckBlock(const CBlockHeader &header,
                          const chain::CBlockIndex *pindexPrev,
                          const chain::ChainParams &params,
                          int64_t adjusted_time, BlockValidationState &state) {
  const int expected_height = pindexPrev ? pindexPrev->nHeight + 1 : 0;
  if (header.nHeight != expected_height) {
    return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL, "bad-height",
                         "expected height " + std::to_string(expected_height) +
                             ", got " + std::to_string(header.nHeight));
  }

  uint32_t expected_bits = consensus::GetNextWorkRequired(pindexPrev, params);
  if (header.nBits != expected_bits) {
    return state.Invalid(BlockValidationResult::BLOCK_INVALID_POW,
                         "bad-diffbits",
                         "incorrect difficulty: expected " +
                             std::to_string(expected_bits) + ", got " +
                             std::to_string(header.nBits));
  }

  if (pindexPrev) {
    int64_t median_time_past = pindexPrev->GetMedianTimePast();
    if (header.GetBlockTime() <= median_time_past) {
      return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                           "time-too-old",
                           "block's timestamp is too early: " +
                               std::to_string(header.nTime) +
                               " <= " + std::to_string(median_time_past));
    }
  }

  const int64_t max_time =
      adjusted_time + params.GetConsensus().nMaxFutureBlockTime;
  if (header.GetBlockTime() > max_time) {
    return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                         "time-too-new",
                         "block timestamp too far in future: " +
                             std::to_string(header.nTime) + " > " +
                             std::to_string(max_time));
  }
  return true;
}

int64_t GetAdjustedTime() { return util::GetTime(); }

} // namespace validation
} // namespace lunachain
