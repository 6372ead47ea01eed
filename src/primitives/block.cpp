// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "primitives/block.hpp"
#include "crypto/key.hpp"
#include "crypto/sha256.hpp"
#include <algorithm>
#include <sstream>

namespace lunachain {

namespace {

void WriteLE32(uint8_t *p, uint32_t v) {
  for (int i = 0; i < 4; ++i)
    p[i] = static_cast<uint8_t>(v >> (8 * i));
}

void WriteLE64(uint8_t *p, uint64_t v) {
  for (int i = 0; i < 8; ++i)
    p[i] = static_cast<uint8_t>(v >> (8 * i));
}

uint32_t ReadLE32(const uint8_t *p) {
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i)
    v |= static_cast<uint32_t>(p[i]) << (8 * i);
  return v;
}

uint64_t ReadLE64(const uint8_t *p) {
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i)
    v |= static_cast<uint64_t>(p[i]) << (8 * i);
  return v;
}

static_assert(CBlockHeader::HEADER_SIZE == 108, "HEADER_SIZE mismatch");

} // namespace

uint256 CBlockHeader::GetHash() const {
  const auto s = SerializeFixed();
  return crypto::SHA256d(s.data(), s.size());
}

CBlockHeader::HeaderBytes CBlockHeader::SerializeFixed() const {
  HeaderBytes data{};
  WriteLE32(data.data() + OFF_VERSION, static_cast<uint32_t>(nVersion));
  WriteLE32(data.data() + OFF_HEIGHT, static_cast<uint32_t>(nHeight));
  std::copy(hashPrevBlock.begin(), hashPrevBlock.end(), data.begin() + OFF_PREV);
  std::copy(hashMerkleRoot.begin(), hashMerkleRoot.end(),
            data.begin() + OFF_MERKLE);
  std::copy(minerAddress.begin(), minerAddress.end(), data.begin() + OFF_MINER);
  WriteLE32(data.data() + OFF_TIME, nTime);
  WriteLE32(data.data() + OFF_BITS, nBits);
  WriteLE64(data.data() + OFF_NONCE, nNonce);
  return data;
}

bool CBlockHeader::Deserialize(const uint8_t *data, size_t size) {
  if (size != HEADER_SIZE) {
    return false;
  }
  nVersion = static_cast<int32_t>(ReadLE32(data + OFF_VERSION));
  nHeight = static_cast<int32_t>(ReadLE32(data + OFF_HEIGHT));
  std::copy(data + OFF_PREV, data + OFF_PREV + UINT256_BYTES,
            hashPrevBlock.begin());
  std::copy(data + OFF_MERKLE, data + OFF_MERKLE + UINT256_BYTES,
            hashMerkleRoot.begin());
  std::copy(data + OFF_MINER, data + OFF_MINER + UINT160_BYTES,
            minerAddress.begin());
  nTime = ReadLE32(data + OFF_TIME);
  nBits = ReadLE32(data + OFF_BITS);
  nNonce = ReadLE64(data + OFF_NONCE);
  return true;
}

void CBlockHeader::Serialize(DataStream &s) const {
  const auto bytes = SerializeFixed();
  s.WriteBytes(bytes.data(), bytes.size());
}

void CBlockHeader::Unserialize(DataStream &s) {
  HeaderBytes bytes{};
  for (auto &b : bytes) {
    b = s.ReadInt<uint8_t>();
  }
  Deserialize(bytes.data(), bytes.size());
}

std::string CBlockHeader::GetMinerAddress() const {
  return crypto::AddressFromHash(minerAddress);
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader(\n";
  s << "  version=" << nVersion << "\n";
  s << "  height=" << nHeight << "\n";
  s << "  hashPrevBlock=" << hashPrevBlock.GetHex() << "\n";
  s << "  hashMerkleRoot=" << hashMerkleRoot.GetHex() << "\n";
  s << "  minerAddress=" << GetMinerAddress() << "\n";
  s << "  nTime=" << nTime << "\n";
  s << "  nBits=0x" << std::hex << nBits << std::dec << "\n";
  s << "  nNonce=" << nNonce << "\n";
  s << "  hash=" << GetHash().GetHex() << "\n";
  s << ")\n";
  return s.str();
}

void CBlock::Serialize(DataStream &s) const {
  CBlockHeader::Serialize(s);
  s.WriteCompactSize(vtx.size());
  for (const auto &tx : vtx) {
    tx->Serialize(s);
  }
}

void CBlock::Unserialize(DataStream &s) {
  CBlockHeader::Unserialize(s);
  uint64_t count = s.ReadCompactSize();
  vtx.clear();
  for (uint64_t i = 0; i < count; ++i) {
    vtx.push_back(DeserializeTransaction(s));
  }
}

std::string CBlock::ToString() const {
  std::stringstream s;
  s << "CBlock(hash=" << GetHash().ToString().substr(0, 16)
    << ", height=" << nHeight << ", vtx=" << vtx.size() << ")";
  return s.str();
}

uint256 ComputeMerkleRoot(std::vector<uint256> hashes) {
  if (hashes.empty()) {
    return uint256();
  }
  while (hashes.size() > 1) {
    if (hashes.size() & 1) {
      hashes.push_back(hashes.back());
    }
    std::vector<uint256> next;
    next.reserve(hashes.size() / 2);
    for (size_t i = 0; i < hashes.size(); i += 2) {
      uint8_t buf[64];
      std::copy(hashes[i].begin(), hashes[i].end(), buf);
      std::copy(hashes[i + 1].begin(), hashes[i + 1].end(), buf + 32);
      next.push_back(crypto::SHA256d(buf, sizeof(buf)));
    }
    hashes = std::move(next);
  }
  return hashes[0];
}

uint256 BlockMerkleRoot(const CBlock &block) {
  std::vector<uint256> leaves;
  leaves.reserve(block.vtx.size());
  for (const auto &tx : block.vtx) {
    leaves.push_back(tx->GetHash());
  }
  return ComputeMerkleRoot(std::move(leaves));
}

CBlock DeserializeBlock(const std::vector<uint8_t> &raw) {
  DataStream s(raw);
  CBlock block;
  s >> block;
  if (!s.empty()) {
    throw std::ios_base::failure("DeserializeBlock(): trailing bytes");
  }
  return block;
}

std::vector<uint8_t> SerializeBlock(const CBlock &block) {
  DataStream s;
  s << block;
  return s.data();
}

} // namespace lunachain
