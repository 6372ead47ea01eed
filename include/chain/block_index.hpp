// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#pragma once

#include "chain/arith_uint256.hpp"
#include "primitives/block.hpp"
#include "util/uint.hpp"
#include <algorithm>
#include <cstdint>
#include <string>

namespace lunachain {
namespace chain {

// Median Time Past calculation span (number of previous blocks)
static constexpr int MEDIAN_TIME_SPAN = 11;
static_assert(MEDIAN_TIME_SPAN % 2 == 1,
              "MEDIAN_TIME_SPAN must be odd for proper median calculation");

// How far a block has been validated. Validity levels are sequential
// integers in the low byte; failure flags live in the high bits.
enum BlockStatus : uint32_t {
  BLOCK_VALID_UNKNOWN = 0,

  //! Structure, merkle root and proof-of-work checked
  BLOCK_VALID_HEADER = 1,

  //! Parent known, height/difficulty/timestamp match the parent
  BLOCK_VALID_TREE = 2,

  //! Every transaction applied against the parent state
  BLOCK_VALID_TRANSACTIONS = 3,

  BLOCK_FAILED_VALID = 32, //! Stage after last reached validity failed
  BLOCK_FAILED_CHILD = 64, //! Descends from failed block
  BLOCK_FAILED_MASK = BLOCK_FAILED_VALID | BLOCK_FAILED_CHILD,
};

static constexpr uint32_t VALIDITY_LEVEL_MASK = 0xFF;

// CBlockIndex - metadata for one known block. Header fields are stored
// inline; the transactions live in BlockManager.
class CBlockIndex {
public:
  uint32_t nStatus{0};

  /**
   * Pointer to the block's hash (DOES NOT OWN).
   *
   * Points to the key of the BlockManager map entry that owns this index.
   * Requires pointer stability, so BlockManager uses std::map.
   */
  const uint256 *phashBlock{nullptr};

  // Parent (nullptr for genesis), owned by BlockManager
  CBlockIndex *pprev{nullptr};

  // Skip-list ancestor for O(log n) GetAncestor, set by BuildSkip()
  CBlockIndex *pskip{nullptr};

  int nHeight{0};

  // Cumulative work up to and including this block
  arith_uint256 nChainWork{};

  int32_t nVersion{0};
  uint256 hashMerkleRoot{};
  uint160 minerAddress{};
  uint32_t nTime{0};
  uint32_t nBits{0};
  uint64_t nNonce{0};

  uint32_t nTx{0};

  // Local arrival time (not consensus)
  int64_t nTimeReceived{0};

  CBlockIndex() = default;

  explicit CBlockIndex(const CBlockHeader &block)
      : nHeight{block.nHeight}, nVersion{block.nVersion},
        hashMerkleRoot{block.hashMerkleRoot}, minerAddress{block.minerAddress},
        nTime{block.nTime}, nBits{block.nBits}, nNonce{block.nNonce} {}

  // phashBlock must have been set by BlockManager
  [[nodiscard]] const uint256 &GetBlockHash() const noexcept {
    return *phashBlock;
  }

  [[nodiscard]] CBlockHeader GetBlockHeader() const {
    CBlockHeader block;
    block.nVersion = nVersion;
    block.nHeight = nHeight;
    if (pprev)
      block.hashPrevBlock = pprev->GetBlockHash();
    block.hashMerkleRoot = hashMerkleRoot;
    block.minerAddress = minerAddress;
    block.nTime = nTime;
    block.nBits = nBits;
    block.nNonce = nNonce;
    return block;
  }

  [[nodiscard]] int64_t GetBlockTime() const noexcept {
    return static_cast<int64_t>(nTime);
  }

  // Median of the last MEDIAN_TIME_SPAN block times (fewer near genesis).
  // A child's time must be strictly greater.
  [[nodiscard]] int64_t GetMedianTimePast() const {
    int64_t pmedian[MEDIAN_TIME_SPAN];
    int64_t *pbegin = &pmedian[MEDIAN_TIME_SPAN];
    int64_t *pend = &pmedian[MEDIAN_TIME_SPAN];

    const CBlockIndex *pindex = this;
    for (int i = 0; i < MEDIAN_TIME_SPAN && pindex; i++, pindex = pindex->pprev)
      *(--pbegin) = pindex->GetBlockTime();

    std::sort(pbegin, pend);
    return pbegin[(pend - pbegin) / 2];
  }

  // Must be called after pprev and nHeight are set
  void BuildSkip();

  [[nodiscard]] const CBlockIndex *GetAncestor(int height) const;
  [[nodiscard]] CBlockIndex *GetAncestor(int height);

  [[nodiscard]] bool
  IsValid(enum BlockStatus nUpTo = BLOCK_VALID_TRANSACTIONS) const noexcept {
    if (nStatus & BLOCK_FAILED_MASK)
      return false;
    return ((nStatus & VALIDITY_LEVEL_MASK) >= nUpTo);
  }

  // Returns true if the level changed
  bool RaiseValidity(enum BlockStatus nUpTo) noexcept {
    if (nStatus & BLOCK_FAILED_MASK)
      return false;
    if ((nStatus & VALIDITY_LEVEL_MASK) < nUpTo) {
      nStatus = (nStatus & ~VALIDITY_LEVEL_MASK) | nUpTo;
      return true;
    }
    return false;
  }

  [[nodiscard]] std::string ToString() const;

  // phashBlock and pprev point into BlockManager's map; never copy
  CBlockIndex(const CBlockIndex &) = delete;
  CBlockIndex &operator=(const CBlockIndex &) = delete;
  CBlockIndex(CBlockIndex &&) = delete;
  CBlockIndex &operator=(CBlockIndex &&) = delete;
};

// work = 2^256 / (target + 1); invalid targets yield 0
[[nodiscard]] arith_uint256 GetBlockProof(uint32_t nBits);
[[nodiscard]] arith_uint256 GetBlockProof(const CBlockIndex &block);

// nullptr if either input is nullptr or the blocks share no ancestor
[[nodiscard]] const CBlockIndex *LastCommonAncestor(const CBlockIndex *pa,
                                                    const CBlockIndex *pb);

} // namespace chain
} // namespace lunachain
