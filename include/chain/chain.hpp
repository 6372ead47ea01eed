// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CHAIN_CHAIN_HPP
#define LUNACHAIN_CHAIN_CHAIN_HPP

#include "chain/block_index.hpp"
#include <vector>

namespace lunachain {
namespace chain {

/**
 * CChain - the active chain as a height-indexed vector of CBlockIndex
 * pointers. Does not own the entries; BlockManager does.
 */
class CChain {
public:
  CChain() = default;

  CChain(const CChain &) = delete;
  CChain &operator=(const CChain &) = delete;
  CChain(CChain &&) noexcept = default;
  CChain &operator=(CChain &&) noexcept = default;

  CBlockIndex *Tip() const { return vChain.empty() ? nullptr : vChain.back(); }

  // nullptr if no such height
  CBlockIndex *operator[](int nHeight) const {
    if (nHeight < 0 || nHeight >= Height() + 1) {
      return nullptr;
    }
    return vChain[nHeight];
  }

  bool Contains(const CBlockIndex *pindex) const {
    return pindex && (*this)[pindex->nHeight] == pindex;
  }

  // -1 when empty
  int Height() const { return static_cast<int>(vChain.size()) - 1; }

  // Make block the tip; entries shared with the previous chain are kept
  void SetTip(CBlockIndex &block);


private:
  std::vector<CBlockIndex *> vChain;
};

} // namespace chain
} // namespace lunachain

#endif // LUNACHAIN_CHAIN_CHAIN_HPP
