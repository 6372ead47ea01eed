// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "mining/block_assembler.hpp"
#include "chain/chainparams.hpp"
#include "consensus/tx_verification.hpp"
#include "crypto/key.hpp"
#include "mempool/txmempool.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "validation/chainstate_manager.hpp"
#include <algorithm>

namespace lunachain {
namespace mining {

BlockAssembler::BlockAssembler(const chain::ChainParams &params,
                               validation::ChainstateManager &chainstate,
                               const mempool::CTxMemPool *mempool)
    : params_(params), chainstate_(chainstate), mempool_(mempool) {}

std::optional<BlockTemplate>
BlockAssembler::CreateNewBlock(const std::string &miner_address) {
  auto normalized = crypto::NormalizeAddress(miner_address);
  if (!normalized) {
    LOG_MINING_ERROR("BlockAssembler: invalid miner address '{}'",
                     miner_address);
    return std::nullopt;
  }
  auto miner_hash = crypto::AddressToHash(*normalized);
  if (!miner_hash) {
    return std::nullopt;
  }

  validation::MiningSnapshot snapshot = chainstate_.GetMiningSnapshot();
  if (!snapshot.state) {
    LOG_MINING_ERROR("BlockAssembler: chainstate has no tip");
    return std::nullopt;
  }

  BlockTemplate tmpl;
  tmpl.hashPrevBlock = snapshot.prev_hash;
  tmpl.nHeight = snapshot.height;
  tmpl.nBits = snapshot.nBits;
  tmpl.tip_version = snapshot.tip_version;

  CBlock &block = tmpl.block;
  block.nVersion = 1;
  block.nHeight = snapshot.height;
  block.hashPrevBlock = snapshot.prev_hash;
  block.minerAddress = *miner_hash;
  block.nBits = snapshot.nBits;
  block.nNonce = 0;

  // Ensure timestamp is greater than median time past
  int64_t now = util::GetTime();
  block.nTime = static_cast<uint32_t>(
      std::max<int64_t>(now, snapshot.median_time_past + 1));

  if (mempool_) {
    const auto &settings = params_.GetSettings();
    size_t max_bytes = settings.max_block_bytes > BLOCK_OVERHEAD_BYTES
                           ? settings.max_block_bytes - BLOCK_OVERHEAD_BYTES
                           : 0;
    std::vector<CTransactionRef> selected =
        mempool_->SelectForBlock(max_bytes, settings.max_block_transactions);

    // The mempool may lag behind the snapshot; keep only what applies.
    // Skipping one of a sender's transactions makes its later nonces fail.
    chain::AccountState view = *snapshot.state;
    size_t skipped = 0;
    for (const auto &tx : selected) {
      validation::TxValidationState state;
      if (!consensus::CheckTxAgainstAccount(*tx, view.Get(tx->sender),
                                            state)) {
        LOG_MINING_DEBUG("BlockAssembler: skipping {} ({})",
                         tx->GetHash().ToString().substr(0, 16),
                         state.ToString());
        ++skipped;
        continue;
      }
      consensus::ApplyTransaction(*tx, view, nullptr);
      tmpl.fees += tx->fee;
      block.vtx.push_back(tx);
    }
    if (skipped > 0) {
      LOG_MINING_DEBUG("BlockAssembler: {} selected transactions no longer "
                       "apply to the tip",
                       skipped);
    }
  }

  block.hashMerkleRoot = BlockMerkleRoot(block);

  LOG_MINING_DEBUG("BlockAssembler: template height={} prev={} txs={} fees={}",
                   tmpl.nHeight, tmpl.hashPrevBlock.ToString().substr(0, 16),
                   block.vtx.size(), tmpl.fees);
  return tmpl;
}

} // namespace mining
} // namespace lunachain
