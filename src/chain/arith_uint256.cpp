// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "chain/arith_uint256.hpp"
#include <algorithm>
#include <iterator>
#include <vector>

namespace lunachain {

arith_uint256 UintToArith256(const uint256 &a) {
  arith_uint256 out;
  boost::multiprecision::import_bits(out, a.begin(), a.end(), 8, true);
  return out;
}

uint256 ArithToUint256(const arith_uint256 &a) {
  std::vector<unsigned char> bytes;
  boost::multiprecision::export_bits(a, std::back_inserter(bytes), 8, true);
  std::vector<unsigned char> padded(uint256::size(), 0);
  size_t n = std::min(bytes.size(), padded.size());
  std::copy(bytes.end() - n, bytes.end(), padded.end() - n);
  return uint256(padded);
}

unsigned int Bits(const arith_uint256 &value) {
  if (value == 0) {
    return 0;
  }
  return boost::multiprecision::msb(value) + 1;
}

arith_uint256 SetCompact(uint32_t nCompact, bool *pfNegative, bool *pfOverflow) {
  int nSize = nCompact >> 24;
  uint32_t nWord = nCompact & 0x007fffff;
  arith_uint256 out;
  if (nSize <= 3) {
    nWord >>= 8 * (3 - nSize);
    out = nWord;
  } else {
    out = nWord;
    // Shifts past 256 bits are reported through pfOverflow
    if (nSize - 3 < 32) {
      out <<= 8 * (nSize - 3);
    } else {
      out = 0;
    }
  }
  if (pfNegative)
    *pfNegative = nWord != 0 && (nCompact & 0x00800000) != 0;
  if (pfOverflow)
    *pfOverflow = nWord != 0 && ((nSize > 34) || (nWord > 0xff && nSize > 33) ||
                                 (nWord > 0xffff && nSize > 32));
  return out;
}

uint32_t GetCompact(const arith_uint256 &value) {
  int nSize = static_cast<int>((Bits(value) + 7) / 8);
  uint32_t nCompact = 0;
  if (nSize <= 3) {
    nCompact = static_cast<uint32_t>(value.convert_to<uint64_t>()
                                     << 8 * (3 - nSize));
  } else {
    arith_uint256 shifted = value >> (8 * (nSize - 3));
    nCompact = static_cast<uint32_t>((shifted & 0xffffffffu).convert_to<uint64_t>());
  }
  // The 0x00800000 bit is the sign; move up a byte if it would be set
  if (nCompact & 0x00800000) {
    nCompact >>= 8;
    nSize++;
  }
  nCompact |= static_cast<uint32_t>(nSize) << 24;
  return nCompact;
}

} // namespace lunachain
