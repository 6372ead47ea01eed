// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_VALIDATION_CHAIN_SELECTOR_HPP
#define LUNACHAIN_VALIDATION_CHAIN_SELECTOR_HPP

#include "chain/block_index.hpp"
#include "chain/block_manager.hpp"
#include <set>

namespace lunachain {
namespace validation {

/**
 * Fork-choice ordering for std::set<CBlockIndex*>:
 * 1. Higher chain work comes first
 * 2. Equal work: lexicographically smaller block hash comes first
 *
 * The order depends only on block contents, so every node given the same
 * blocks picks the same tip regardless of arrival order.
 *
 * nChainWork must not change while an entry is in the set (BlockManager
 * sets it once at creation).
 */
struct CBlockIndexWorkComparator {
  bool operator()(const chain::CBlockIndex *pa,
                  const chain::CBlockIndex *pb) const;
};

// True if candidate should replace tip under the ordering above
bool IsBetterTip(const chain::CBlockIndex *candidate,
                 const chain::CBlockIndex *tip);

/**
 * ChainSelector - candidate tips for fork choice
 *
 * The candidate set contains fully validated leaf blocks. FindMostWorkChain
 * returns the first candidate that is not marked failed.
 *
 * THREAD SAFETY: no mutex of its own; the caller (ChainstateManager) holds
 * validation_mutex_.
 */
class ChainSelector {
public:
  ChainSelector() = default;

  // nullptr if there is no valid candidate
  chain::CBlockIndex *FindMostWorkChain();

  /**
   * Add pindex if it is fully validated and has no validated children.
   * Its parent stops being a leaf and is removed.
   */
  void TryAddBlockIndexCandidate(chain::CBlockIndex *pindex,
                                 const chain::BlockManager &block_manager);

  // Drop candidates that can no longer beat the active tip
  void PruneBlockIndexCandidates(const chain::BlockManager &block_manager);

  void RemoveCandidate(chain::CBlockIndex *pindex) { m_candidates.erase(pindex); }

  void AddCandidateUnchecked(chain::CBlockIndex *pindex) {
    m_candidates.insert(pindex);
  }

  void ClearCandidates() { m_candidates.clear(); }


private:
  std::set<chain::CBlockIndex *, CBlockIndexWorkComparator> m_candidates;
};

} // namespace validation
} // namespace lunachain

#endif // LUNACHAIN_VALIDATION_CHAIN_SELECTOR_HPP
