// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CHAIN_ARITH_UINT256_HPP
#define LUNACHAIN_CHAIN_ARITH_UINT256_HPP

#include "util/uint.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>

namespace lunachain {

// 256-bit unsigned arithmetic for targets and chain work
using arith_uint256 = boost::multiprecision::uint256_t;
// Intermediate width for retarget products
using arith_uint512 = boost::multiprecision::uint512_t;

// Interpret a display-order blob as a big-endian number
arith_uint256 UintToArith256(const uint256 &a);
uint256 ArithToUint256(const arith_uint256 &a);

/**
 * Decode a Bitcoin-style compact target ("nBits").
 *
 * The top byte is the size in bytes, the low 23 bits the mantissa, and bit 23
 * the sign. pfNegative/pfOverflow report the sign bit and values that do not
 * fit in 256 bits.
 */
arith_uint256 SetCompact(uint32_t nCompact, bool *pfNegative = nullptr,
                         bool *pfOverflow = nullptr);

// Encode to compact form (lossy: only the top 23 bits survive)
uint32_t GetCompact(const arith_uint256 &value);

// Number of significant bits (0 for zero)
unsigned int Bits(const arith_uint256 &value);

} // namespace lunachain

#endif // LUNACHAIN_CHAIN_ARITH_UINT256_HPP
