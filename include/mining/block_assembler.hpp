// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_MINING_BLOCK_ASSEMBLER_HPP
#define LUNACHAIN_MINING_BLOCK_ASSEMBLER_HPP

#include "primitives/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace lunachain {

namespace chain {
class ChainParams;
}

namespace validation {
class ChainstateManager;
}

namespace mempool {
class CTxMemPool;
}

namespace mining {

// Block template - full block ready for mining, nonce unset
struct BlockTemplate {
  CBlock block;
  uint32_t nBits{0};
  int nHeight{0};
  uint256 hashPrevBlock;
  // Tip version the template was built against
  uint64_t tip_version{0};
  CAmount fees{0};
};

/**
 * Builds candidate blocks on top of the active tip.
 *
 * Tip, target and account state come from one chainstate snapshot, so the
 * template is consistent even while blocks are being integrated. Mempool
 * transactions that no longer apply to that state are left out.
 */
class BlockAssembler {
public:
  // Room kept for the header and the transaction count
  static constexpr size_t BLOCK_OVERHEAD_BYTES = CBlockHeader::HEADER_SIZE + 9;

  BlockAssembler(const chain::ChainParams &params,
                 validation::ChainstateManager &chainstate,
                 const mempool::CTxMemPool *mempool);

  // nullopt if the miner address is malformed or there is no tip
  std::optional<BlockTemplate> CreateNewBlock(const std::string &miner_address);

private:
  const chain::ChainParams &params_;
  validation::ChainstateManager &chainstate_;
  const mempool::CTxMemPool *mempool_;
};

} // namespace mining
} // namespace lunachain

#endif // LUNACHAIN_MINING_BLOCK_ASSEMBLER_HPP
