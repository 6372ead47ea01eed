// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "chain/chain.hpp"

namespace lunachain {
namespace chain {

void CChain::SetTip(CBlockIndex &block) {
  vChain.resize(static_cast<size_t>(block.nHeight) + 1);

  // Stop at the first height that already holds our ancestor
  for (CBlockIndex *walk = &block; walk && vChain[walk->nHeight] != walk;
       walk = walk->pprev) {
    vChain[walk->nHeight] = walk;
  }
}

} // namespace chain
} // namespace lunachain
