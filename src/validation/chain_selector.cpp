// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "validation/chain_selector.hpp"
#include "util/logging.hpp"

namespace lunachain {
namespace validation {

bool CBlockIndexWorkComparator::operator()(const chain::CBlockIndex *pa,
                                           const chain::CBlockIndex *pb) const {
  if (pa->nChainWork != pb->nChainWork) {
    return pa->nChainWork > pb->nChainWork;
  }
  return pa->GetBlockHash() < pb->GetBlockHash();
}

bool IsBetterTip(const chain::CBlockIndex *candidate,
                 const chain::CBlockIndex *tip) {
  if (candidate == nullptr) {
    return false;
  }
  if (tip == nullptr) {
    return true;
  }
  if (candidate == tip) {
    return false;
  }
  return CBlockIndexWorkComparator()(candidate, tip);
}

chain::CBlockIndex *ChainSelector::FindMostWorkChain() {
  for (auto it = m_candidates.begin(); it != m_candidates.end();) {
    chain::CBlockIndex *pindex = *it;
    if (pindex->IsValid(chain::BLOCK_VALID_TRANSACTIONS)) {
      return pindex;
    }
    LOG_CHAIN_TRACE("FindMostWorkChain: dropping failed candidate {}",
                    pindex->GetBlockHash().ToString().substr(0, 16));
    it = m_candidates.erase(it);
  }
  return nullptr;
}

void ChainSelector::TryAddBlockIndexCandidate(
    chain::CBlockIndex *pindex, const chain::BlockManager &block_manager) {
  if (pindex == nullptr || !pindex->IsValid(chain::BLOCK_VALID_TRANSACTIONS)) {
    return;
  }

  for (chain::CBlockIndex *child : block_manager.GetChildren(pindex->GetBlockHash())) {
    if (child->IsValid(chain::BLOCK_VALID_TRANSACTIONS)) {
      return;
    }
  }

  if (pindex->pprev) {
    m_candidates.erase(pindex->pprev);
  }
  m_candidates.insert(pindex);
}

void ChainSelector::PruneBlockIndexCandidates(
    const chain::BlockManager &block_manager) {
  const chain::CBlockIndex *tip = block_manager.GetTip();
  if (tip == nullptr) {
    return;
  }

  for (auto it = m_candidates.begin(); it != m_candidates.end();) {
    chain::CBlockIndex *pindex = *it;
    bool remove = false;
    if (!pindex->IsValid(chain::BLOCK_VALID_TRANSACTIONS)) {
      remove = true;
    } else if (pindex != tip && block_manager.ActiveChain().Contains(pindex)) {
      // Interior of the active chain
      remove = true;
    } else if (pindex != tip && !IsBetterTip(pindex, tip)) {
      remove = true;
    }

    if (remove) {
      it = m_candidates.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace validation
} // namespace lunachain
