// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_PRIMITIVES_BLOCK_HPP
#define LUNACHAIN_PRIMITIVES_BLOCK_HPP

#include "primitives/transaction.hpp"
#include "util/serialize.hpp"
#include "util/uint.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace lunachain {

/**
 * Block header
 *
 * Fixed 108-byte wire format, all integers little-endian:
 *   nVersion(4) nHeight(4) hashPrevBlock(32) hashMerkleRoot(32)
 *   minerAddress(20) nTime(4) nBits(4) nNonce(8)
 *
 * The block identity is SHA256d of these bytes. The proof-of-work hash is
 * computed over the same bytes by the network's PowHasher.
 */
class CBlockHeader {
public:
  static constexpr size_t UINT256_BYTES = 32;
  static constexpr size_t UINT160_BYTES = 20;

  static constexpr size_t OFF_VERSION = 0;
  static constexpr size_t OFF_HEIGHT = 4;
  static constexpr size_t OFF_PREV = 8;
  static constexpr size_t OFF_MERKLE = OFF_PREV + UINT256_BYTES;
  static constexpr size_t OFF_MINER = OFF_MERKLE + UINT256_BYTES;
  static constexpr size_t OFF_TIME = OFF_MINER + UINT160_BYTES;
  static constexpr size_t OFF_BITS = OFF_TIME + 4;
  static constexpr size_t OFF_NONCE = OFF_BITS + 4;
  static constexpr size_t HEADER_SIZE = OFF_NONCE + 8;

  using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

  int32_t nVersion{1};
  int32_t nHeight{0};
  uint256 hashPrevBlock;
  uint256 hashMerkleRoot;
  uint160 minerAddress; // payload of the reward recipient address
  uint32_t nTime{0};
  uint32_t nBits{0};
  uint64_t nNonce{0};

  void SetNull() { *this = CBlockHeader{}; }
  bool IsNull() const { return nBits == 0; }

  uint256 GetHash() const;

  HeaderBytes SerializeFixed() const;
  // False unless size == HEADER_SIZE
  bool Deserialize(const uint8_t *data, size_t size);

  void Serialize(DataStream &s) const;
  void Unserialize(DataStream &s);

  // Canonical reward recipient address
  std::string GetMinerAddress() const;

  int64_t GetBlockTime() const { return static_cast<int64_t>(nTime); }

  std::string ToString() const;
};

class CBlock : public CBlockHeader {
public:
  std::vector<CTransactionRef> vtx;

  CBlock() = default;
  explicit CBlock(const CBlockHeader &header) : CBlockHeader(header) {}

  const CBlockHeader &GetHeader() const { return *this; }

  void Serialize(DataStream &s) const;
  void Unserialize(DataStream &s);

  size_t GetSerializedSize() const { return GetSerializeSize(*this); }

  std::string ToString() const;
};

/**
 * Merkle root of transaction hashes (pairwise SHA256d, last element
 * duplicated on odd levels). Null for an empty list.
 */
uint256 ComputeMerkleRoot(std::vector<uint256> hashes);
uint256 BlockMerkleRoot(const CBlock &block);

// Throws std::ios_base::failure on malformed input or trailing bytes
CBlock DeserializeBlock(const std::vector<uint8_t> &raw);
std::vector<uint8_t> SerializeBlock(const CBlock &block);

} // namespace lunachain

#endif // LUNACHAIN_PRIMITIVES_BLOCK_HPP
