// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "chain/block_index.hpp"
#include "crypto/key.hpp"
#include <iomanip>
#include <sstream>

namespace lunachain {
namespace chain {

namespace {

int InvertLowestOne(int n) { return n & (n - 1); }

// Height a skip pointer at `height` jumps back to
int GetSkipHeight(int height) {
  if (height < 2)
    return 0;
  // Any number strictly lower than height works; this choice keeps both
  // long and short jumps available
  return (height & 1) ? InvertLowestOne(InvertLowestOne(height - 1)) + 1
                      : InvertLowestOne(height);
}

} // namespace

void CBlockIndex::BuildSkip() {
  if (pprev)
    pskip = pprev->GetAncestor(GetSkipHeight(nHeight));
}

const CBlockIndex *CBlockIndex::GetAncestor(int height) const {
  if (height > nHeight || height < 0) {
    return nullptr;
  }

  const CBlockIndex *pindexWalk = this;
  int heightWalk = nHeight;
  while (heightWalk > height) {
    int heightSkip = GetSkipHeight(heightWalk);
    int heightSkipPrev = GetSkipHeight(heightWalk - 1);
    if (pindexWalk->pskip != nullptr &&
        (heightSkip == height ||
         (heightSkip > height && !(heightSkipPrev < heightSkip - 2 &&
                                   heightSkipPrev >= height)))) {
      pindexWalk = pindexWalk->pskip;
      heightWalk = heightSkip;
    } else {
      if (pindexWalk->pprev == nullptr) {
        return nullptr;
      }
      pindexWalk = pindexWalk->pprev;
      heightWalk--;
    }
  }
  return pindexWalk;
}

CBlockIndex *CBlockIndex::GetAncestor(int height) {
  return const_cast<CBlockIndex *>(
      static_cast<const CBlockIndex *>(this)->GetAncestor(height));
}

std::string CBlockIndex::ToString() const {
  std::ostringstream ss;
  ss << "CBlockIndex("
     << "hash=" << (phashBlock ? phashBlock->ToString().substr(0, 16) : "null")
     << ", height=" << nHeight << ", chainwork=0x" << std::hex << nChainWork
     << ", status=0x" << nStatus << std::dec << ", time=" << nTime
     << ", bits=0x" << std::hex << nBits << std::dec << ", nonce=" << nNonce
     << ", tx=" << nTx << ", miner=" << crypto::AddressFromHash(minerAddress)
     << ")";
  return ss.str();
}

arith_uint256 GetBlockProof(uint32_t nBits) {
  bool fNegative = false;
  bool fOverflow = false;
  arith_uint256 bnTarget = SetCompact(nBits, &fNegative, &fOverflow);

  if (fNegative || fOverflow || bnTarget == 0)
    return arith_uint256(0);

  // 2**256 / (bnTarget+1) == ~bnTarget / (bnTarget+1) + 1
  return (~bnTarget / (bnTarget + 1)) + 1;
}

arith_uint256 GetBlockProof(const CBlockIndex &block) {
  return GetBlockProof(block.nBits);
}

const CBlockIndex *LastCommonAncestor(const CBlockIndex *pa,
                                      const CBlockIndex *pb) {
  if (pa == nullptr || pb == nullptr) {
    return nullptr;
  }

  if (pa->nHeight > pb->nHeight) {
    pa = pa->GetAncestor(pb->nHeight);
  } else if (pb->nHeight > pa->nHeight) {
    pb = pb->GetAncestor(pa->nHeight);
  }

  while (pa != pb && pa && pb) {
    pa = pa->pprev;
    pb = pb->pprev;
  }
  return pa;
}

} // namespace chain
} // namespace lunachain
